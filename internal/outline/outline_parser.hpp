#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/schedule_record.hpp"
#include "internal/util/time.hpp"

namespace cadence::outline {

struct OutlineOptions {
  util::CivilDate start_date;
  std::string     community;

  int base_hour    = 10;
  int step_minutes = 5;

  // Generation placeholder stripped from every body.
  std::string placeholder = "/LLM generated sentence/";
};

/*
  Outline -> flat schedule records.

  Grammar (line oriented, whitespace tolerant):

    Day <n>: <title>                  opens day n, resets the time slots
    ID  Bot ...                       table header, ignored
    <id>[.]<TAB><account><TAB><body>  row
    <id>[.] <account>  <body>         row, fallback (2+ spaces before body)
    <anything else>                   continuation of the open row, else dropped

  A blank line, a row, a day header or a table header closes the open row.
  The parser never fails: unmatched lines are dropped.

  Emitted comment ids are the next sibling ordinal under the parent's emitted
  id, the numbering the schedule table reader rebuilds. Rows past midnight
  stay on their day at 23:59.
*/
class OutlineParser {
 public:
  enum class LineKind {
    kBlank,
    kDayHeader,
    kTableHeader,
    kRow,
    kText,
  };

  enum class State {
    kAwaitingDay,
    kAwaitingRow,
    kAccumulatingBody,
  };

  struct RowFields {
    std::string row_id;
    std::string account;
    std::string body;
  };

  struct DayHeader {
    int         day = 0;
    std::string title;
  };

  explicit OutlineParser(OutlineOptions options);

  std::vector<model::ScheduleRecord> Parse(std::string_view text) const;

  static LineKind                 Classify(std::string_view line);
  static std::optional<DayHeader> MatchDayHeader(std::string_view line);
  static std::optional<RowFields> MatchRow(std::string_view line);

 private:
  class Run;

  OutlineOptions options_;
};

} // namespace cadence::outline
