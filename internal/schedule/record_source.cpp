#include "record_source.hpp"

#include "record_table.hpp"

namespace cadence::schedule {

CsvRecordSource::CsvRecordSource(std::string path) : path_(std::move(path)) {
}

std::vector<model::ScheduleRecord> CsvRecordSource::Load() {
  return ReadRecordsFromFile(path_);
}

} // namespace cadence::schedule
