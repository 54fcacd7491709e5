#include "record_table.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "csv_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cadence::schedule {

using cadence::observability::IntField;
using cadence::observability::StringField;

namespace {

enum Column : std::size_t {
  kDatetime = 0,
  kTime,
  kAccount,
  kTitle,
  kBody,
  kKind,
  kReplyTo,
  kCommunity,
};

std::string Trimmed(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

// (community, date) -> parent row id -> children numbered so far
class SiblingNumbering {
 public:
  std::string Next(const std::string& community, const std::string& date, const std::string& reply_to) {
    const auto ordinal = std::to_string(++children_[{community, date}][reply_to]);
    return reply_to == model::kRootRowId ? ordinal : reply_to + "." + ordinal;
  }

 private:
  std::map<std::pair<std::string, std::string>, std::unordered_map<std::string, int>> children_;
};

// day counts from the earliest date in the table
void AnnotateDays(std::vector<model::ScheduleRecord>& records) {
  std::int64_t first_day = std::numeric_limits<std::int64_t>::max();
  for (const auto& r : records) {
    if (auto date = util::ParseDate(r.date)) first_day = std::min(first_day, util::DaysFromCivil(*date));
  }
  for (auto& r : records) {
    if (auto date = util::ParseDate(r.date)) {
      r.day = static_cast<int>(util::DaysFromCivil(*date) - first_day) + 1;
    }
  }
}

} // namespace

std::string EncodeRecords(const std::vector<model::ScheduleRecord>& records) {
  std::string out;

  CsvRow header(kColumns.begin(), kColumns.end());
  out += EncodeCsvRow(header);

  for (const auto& r : records) {
    out += EncodeCsvRow({r.date, r.time, r.account, r.title, r.body, std::string(model::ToString(r.kind)), r.reply_to, r.community});
  }
  return out;
}

void WriteRecordsToFile(const std::string& path, const std::vector<model::ScheduleRecord>& records) {
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }

  const auto    tmp = target.string() + ".tmp";
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + tmp + " for writing");
  }
  out << EncodeRecords(records);
  out.close();
  if (!out) {
    throw std::runtime_error("failed writing " + tmp);
  }

  std::filesystem::rename(tmp, target);
}

std::vector<model::ScheduleRecord> DecodeRecords(std::string_view text) {
  auto rows = DecodeCsv(text);
  if (rows.empty()) {
    throw util::ConfigurationError("schedule table has no header row");
  }

  std::array<std::size_t, kColumns.size()> positions{};
  const auto&                              header = rows.front();
  for (std::size_t c = 0; c < kColumns.size(); ++c) {
    auto it = std::find_if(header.begin(), header.end(), [&](const std::string& name) { return Trimmed(name) == kColumns[c]; });
    if (it == header.end()) {
      throw util::ConfigurationError("schedule table is missing column '" + std::string(kColumns[c]) + "'");
    }
    positions[c] = static_cast<std::size_t>(it - header.begin());
  }

  std::vector<model::ScheduleRecord> records;
  records.reserve(rows.size() - 1);

  SiblingNumbering                             numbering;
  std::unordered_map<std::string, std::string> last_date;  // community -> date of its last readable row

  for (std::size_t i = 1; i < rows.size(); ++i) {
    const auto& row       = rows[i];
    const auto  row_index = i - 1;
    auto        cell      = [&](Column c) { return positions[c] < row.size() ? Trimmed(row[positions[c]]) : std::string(); };

    model::ScheduleRecord record;
    record.row_index = row_index;
    record.date      = cell(kDatetime);
    record.time      = cell(kTime);
    record.account   = cell(kAccount);
    record.title     = cell(kTitle);
    record.body      = cell(kBody);
    record.reply_to  = cell(kReplyTo);
    record.community = cell(kCommunity);

    const auto kind          = model::ParsePostKind(cell(kKind));
    const bool readable_date = util::ParseDate(record.date).has_value();
    if (record.reply_to.empty()) {
      record.reply_to = std::string(model::kRootRowId);
    }

    if (!kind) {
      CADENCE_LOG_WARN("Skipping schedule row with unknown kind",
                       {IntField("row_index", static_cast<std::int64_t>(row_index)), StringField("kind", cell(kKind))});
    } else if (!readable_date || !util::ParseTimeOfDay(record.time)) {
      CADENCE_LOG_WARN("Skipping schedule row with malformed date/time",
                       {IntField("row_index", static_cast<std::int64_t>(row_index)), StringField("datetime", record.date),
                        StringField("time", record.time)});
    } else {
      last_date[record.community] = record.date;
      record.kind                 = *kind;
      if (record.kind == model::PostKind::kSelf) {
        record.reply_to.clear();
        record.row_id = std::string(model::kRootRowId);
      } else {
        record.row_id = numbering.Next(record.community, record.date, record.reply_to);
      }
      records.push_back(std::move(record));
      continue;
    }

    // A skipped comment keeps its sibling position so later siblings, and
    // their replies, keep the ids the outline gave them.
    if (kind == model::PostKind::kSelf) continue;
    const auto date = readable_date ? record.date : last_date[record.community];
    if (!date.empty()) {
      numbering.Next(record.community, date, record.reply_to);
    }
  }

  AnnotateDays(records);
  return records;
}

std::vector<model::ScheduleRecord> ReadRecordsFromFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::ConfigurationError("schedule file not found: " + path);
  }

  std::ostringstream buf;
  buf << in.rdbuf();
  try {
    return DecodeRecords(buf.str());
  } catch (const util::ConfigurationError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw util::ConfigurationError("malformed schedule file " + path + ": " + e.what());
  }
}

} // namespace cadence::schedule
