#include "schedule_record.hpp"

namespace cadence::model {

std::string_view ToString(PostKind kind) {
  switch (kind) {
    case PostKind::kSelf:
      return "self";
    case PostKind::kComment:
      return "comment";
  }
  return "comment";
}

std::optional<PostKind> ParsePostKind(std::string_view text) {
  if (text == "self") return PostKind::kSelf;
  if (text == "comment") return PostKind::kComment;
  return std::nullopt;
}

std::vector<std::string> SplitRowId(std::string_view row_id) {
  std::vector<std::string> segments;
  std::size_t              start = 0;
  while (true) {
    const auto dot = row_id.find('.', start);
    if (dot == std::string_view::npos) {
      segments.emplace_back(row_id.substr(start));
      break;
    }
    segments.emplace_back(row_id.substr(start, dot - start));
    start = dot + 1;
  }
  return segments;
}

std::string ParentOf(std::string_view row_id) {
  if (row_id.empty() || row_id == kRootRowId) return {};

  const auto dot = row_id.rfind('.');
  if (dot == std::string_view::npos) return std::string(kRootRowId);
  return std::string(row_id.substr(0, dot));
}

PostKind KindOf(std::string_view row_id) {
  return row_id.empty() || row_id == kRootRowId ? PostKind::kSelf : PostKind::kComment;
}

} // namespace cadence::model
