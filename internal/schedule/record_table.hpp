#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/schedule_record.hpp"

namespace cadence::schedule {

/*
  Flat record table (CSV) shared by the converter and the dispatcher.

  Columns, in order:
    datetime,time,account,title,body,kind,reply_to,community

  row_id and day are not stored; the reader reconstructs them. Within each
  (community, date) the thread post is "0" and every parent's children are
  numbered 1, 2, ... in table order, which is how the outline parser numbers
  the rows it emits. day counts from the earliest date in the table.
*/

inline constexpr std::array<std::string_view, 8> kColumns = {
    "datetime", "time", "account", "title", "body", "kind", "reply_to", "community"};

std::string EncodeRecords(const std::vector<model::ScheduleRecord>& records);

// Throws std::runtime_error when the file cannot be written.
void WriteRecordsToFile(const std::string& path, const std::vector<model::ScheduleRecord>& records);

/*
  Decodes a table. Columns are mapped by header name.

  Throws util::ConfigurationError when a column is missing. Rows with an
  unknown kind or a malformed date/time are skipped with a warning; they still
  occupy their row_index, and a skipped comment still takes its place among
  its siblings.
*/
std::vector<model::ScheduleRecord> DecodeRecords(std::string_view text);

// Throws util::ConfigurationError when the file is missing or unreadable.
std::vector<model::ScheduleRecord> ReadRecordsFromFile(const std::string& path);

} // namespace cadence::schedule
