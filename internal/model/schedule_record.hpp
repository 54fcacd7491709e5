#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cadence::model {

enum class PostKind {
  kSelf,     // thread-creating post, row id "0"
  kComment,  // reply somewhere in the thread
};

std::string_view        ToString(PostKind kind);
std::optional<PostKind> ParsePostKind(std::string_view text);

/*
  One unit of content to publish.

  row_id is a dot-separated path ("0", "1", "1.2", "2.1.3") unique within its
  day; reply_to is the parent path ("0" for top-level comments, empty for the
  thread itself).
*/
struct ScheduleRecord {
  int         day = 0;
  std::string date;  // YYYY-MM-DD
  std::string time;  // HH:MM
  std::string row_id;
  std::string account;
  std::string title;
  std::string body;
  PostKind    kind = PostKind::kComment;
  std::string reply_to;
  std::string community;

  // Position in the flat record table.
  std::size_t row_index = 0;
};

inline constexpr std::string_view kRootRowId = "0";

std::vector<std::string> SplitRowId(std::string_view row_id);

// "1" -> "0", "1.2.3" -> "1.2", "0" -> "".
std::string ParentOf(std::string_view row_id);

PostKind KindOf(std::string_view row_id);

} // namespace cadence::model
