#include "outline_parser.hpp"

#include <regex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/observability/logging.hpp"

namespace cadence::outline {

using cadence::observability::IntField;
using cadence::observability::StringField;

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";
constexpr int              kLastMinuteOfDay = 24 * 60 - 1;

std::string_view Trim(std::string_view s) {
  const auto begin = s.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(kWhitespace);
  return s.substr(begin, end - begin + 1);
}

// Leading whitespace and trailing spaces/CR only: a trailing TAB still
// delimits an empty body.
std::string_view TrimRowLine(std::string_view s) {
  const auto begin = s.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \r\n");
  return s.substr(begin, end - begin + 1);
}

const std::regex& DayHeaderPattern() {
  static const std::regex pattern(R"(^Day\s+(\d+):\s*(.+)$)", std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

const std::regex& TabRowPattern() {
  static const std::regex pattern(R"(^(\d+(?:\.\d+)*)?\.?\t(.+?)\t(.*)$)");
  return pattern;
}

const std::regex& SpacedRowPattern() {
  static const std::regex pattern(R"(^(\d+(?:\.\d+)*)\.?\s+(.+?)\s{2,}(.*)$)");
  return pattern;
}

bool IsTableHeader(std::string_view trimmed) {
  return trimmed.starts_with("ID") && trimmed.find("Bot") != std::string_view::npos;
}

std::string CleanBody(std::string body, const std::string& placeholder) {
  if (!placeholder.empty()) {
    for (auto pos = body.find(placeholder); pos != std::string::npos; pos = body.find(placeholder, pos)) {
      body.erase(pos, placeholder.size());
    }
  }
  return std::string(Trim(body));
}

struct InspectedLine {
  OutlineParser::LineKind                 kind = OutlineParser::LineKind::kText;
  std::optional<OutlineParser::DayHeader> day;
  std::optional<OutlineParser::RowFields> row;
};

InspectedLine Inspect(std::string_view line) {
  InspectedLine inspected;

  const auto trimmed = Trim(line);
  if (trimmed.empty()) {
    inspected.kind = OutlineParser::LineKind::kBlank;
    return inspected;
  }

  if (auto day = OutlineParser::MatchDayHeader(trimmed)) {
    inspected.kind = OutlineParser::LineKind::kDayHeader;
    inspected.day  = std::move(day);
    return inspected;
  }

  if (IsTableHeader(trimmed)) {
    inspected.kind = OutlineParser::LineKind::kTableHeader;
    return inspected;
  }

  if (auto row = OutlineParser::MatchRow(line)) {
    inspected.kind = OutlineParser::LineKind::kRow;
    inspected.row  = std::move(row);
    return inspected;
  }

  return inspected;
}

} // namespace

// ------------------------------------------------------------
// Line matching
// ------------------------------------------------------------

std::optional<OutlineParser::DayHeader> OutlineParser::MatchDayHeader(std::string_view line) {
  const std::string trimmed(Trim(line));
  std::smatch       match;
  if (!std::regex_match(trimmed, match, DayHeaderPattern())) return std::nullopt;

  DayHeader header;
  try {
    header.day = std::stoi(match[1].str());
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  header.title = std::string(Trim(match[2].str()));
  return header;
}

std::optional<OutlineParser::RowFields> OutlineParser::MatchRow(std::string_view line) {
  const std::string candidate(TrimRowLine(line));
  if (candidate.empty()) return std::nullopt;

  std::smatch match;
  if (!std::regex_match(candidate, match, TabRowPattern()) && !std::regex_match(candidate, match, SpacedRowPattern())) {
    return std::nullopt;
  }

  RowFields fields;
  fields.row_id  = match[1].matched ? match[1].str() : std::string(model::kRootRowId);
  fields.account = std::string(Trim(match[2].str()));
  fields.body    = std::string(Trim(match[3].str()));
  if (fields.account.empty()) return std::nullopt;
  return fields;
}

OutlineParser::LineKind OutlineParser::Classify(std::string_view line) {
  return Inspect(line).kind;
}

// ------------------------------------------------------------
// Parse run (state machine)
// ------------------------------------------------------------

class OutlineParser::Run {
 public:
  explicit Run(const OutlineOptions& options) : options_(options) {
  }

  void Feed(std::string_view line) {
    auto inspected = Inspect(line);

    if (state_ == State::kAccumulatingBody) {
      if (inspected.kind == LineKind::kText) {
        pending_body_ += ' ';
        pending_body_ += Trim(line);
        return;
      }
      FlushRow();
      state_ = State::kAwaitingRow;
    }

    switch (inspected.kind) {
      case LineKind::kBlank:
      case LineKind::kTableHeader:
      case LineKind::kText:
        return;

      case LineKind::kDayHeader:
        OpenDay(*inspected.day);
        return;

      case LineKind::kRow:
        if (state_ == State::kAwaitingDay) return;
        OpenRow(std::move(*inspected.row));
        return;
    }
  }

  std::vector<model::ScheduleRecord> Finish() {
    if (state_ == State::kAccumulatingBody) {
      FlushRow();
      state_ = State::kAwaitingRow;
    }
    return std::move(records_);
  }

 private:
  void OpenDay(const DayHeader& header) {
    if (header.day < 1) {
      CADENCE_LOG_WARN("Ignoring day header with non-positive day", {IntField("day", header.day)});
      state_ = State::kAwaitingDay;
      return;
    }

    day_       = header.day;
    day_title_ = header.title;
    day_date_  = util::AddDays(options_.start_date, day_ - 1);
    slot_      = 0;
    overflow_warned_ = false;
    seen_row_ids_.clear();
    canonical_ids_.clear();
    child_counts_.clear();
    state_ = State::kAwaitingRow;
  }

  void OpenRow(RowFields fields) {
    pending_       = std::move(fields);
    pending_body_  = pending_.body;
    pending_slot_  = slot_++;
    state_         = State::kAccumulatingBody;
  }

  void FlushRow() {
    model::ScheduleRecord record;
    record.day       = day_;
    record.row_id    = pending_.row_id;
    record.account   = pending_.account;
    record.kind      = model::KindOf(record.row_id);
    record.reply_to  = record.kind == model::PostKind::kSelf ? std::string() : model::ParentOf(record.row_id);
    record.title     = record.kind == model::PostKind::kSelf ? day_title_ : std::string();
    record.body      = CleanBody(std::move(pending_body_), options_.placeholder);
    record.community = options_.community;

    // A day's rows stay on its date: slots past midnight share the last minute.
    int minutes = options_.base_hour * 60 + pending_slot_ * options_.step_minutes;
    if (minutes > kLastMinuteOfDay) {
      if (!overflow_warned_) {
        CADENCE_LOG_WARN("Day runs past midnight; remaining rows are clamped to its last minute",
                         {IntField("day", day_), StringField("row_id", record.row_id)});
        overflow_warned_ = true;
      }
      minutes = kLastMinuteOfDay;
    }
    record.date = util::FormatDate(day_date_);
    record.time = util::FormatTimeOfDay(minutes);

    if (record.kind == model::PostKind::kComment && record.body.empty()) {
      CADENCE_LOG_WARN("Dropping comment with empty body", {IntField("day", day_), StringField("row_id", record.row_id)});
      return;
    }

    if (!seen_row_ids_.insert(record.row_id).second) {
      CADENCE_LOG_WARN("Dropping duplicate row id", {IntField("day", day_), StringField("row_id", record.row_id)});
      return;
    }

    if (record.kind == model::PostKind::kComment) {
      const auto parent_it = canonical_ids_.find(record.reply_to);
      if (record.reply_to != model::kRootRowId && parent_it == canonical_ids_.end()) {
        CADENCE_LOG_WARN("Dropping row that replies to an id not kept earlier in its day",
                         {IntField("day", day_), StringField("row_id", record.row_id), StringField("reply_to", record.reply_to)});
        return;
      }
      const std::string parent = parent_it == canonical_ids_.end() ? record.reply_to : parent_it->second;

      // the flat table stores no row ids; readers number siblings 1, 2, ...
      const auto ordinal   = std::to_string(++child_counts_[parent]);
      const auto canonical = parent == model::kRootRowId ? ordinal : parent + "." + ordinal;
      if (record.row_id != canonical) {
        CADENCE_LOG_WARN("Renumbering row to its sibling position",
                         {IntField("day", day_), StringField("row_id", record.row_id), StringField("renumbered", canonical)});
      }
      canonical_ids_[record.row_id] = canonical;
      record.reply_to               = parent;
      record.row_id                 = canonical;
    } else {
      canonical_ids_[record.row_id] = record.row_id;
    }

    record.row_index = records_.size();
    records_.push_back(std::move(record));
  }

  const OutlineOptions& options_;

  State       state_ = State::kAwaitingDay;
  int         day_   = 0;
  std::string day_title_;
  util::CivilDate day_date_;
  int         slot_ = 0;
  bool        overflow_warned_ = false;

  RowFields   pending_;
  std::string pending_body_;
  int         pending_slot_ = 0;

  std::unordered_set<std::string>              seen_row_ids_;
  std::unordered_map<std::string, std::string> canonical_ids_;  // id as written -> emitted id
  std::unordered_map<std::string, int>         child_counts_;
  std::vector<model::ScheduleRecord> records_;
};

OutlineParser::OutlineParser(OutlineOptions options) : options_(std::move(options)) {
}

std::vector<model::ScheduleRecord> OutlineParser::Parse(std::string_view text) const {
  Run run(options_);

  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    run.Feed(text.substr(start, end - start));
    start = end + 1;
  }

  return run.Finish();
}

} // namespace cadence::outline
