#pragma once

#include <string>
#include <vector>

#include "internal/model/schedule_record.hpp"

namespace cadence::schedule {

/*
  Backing store of the schedule.

  Load() is called once per run-once pass and once per watch tick, so edits to
  the store take effect without a restart.
*/
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual std::vector<model::ScheduleRecord> Load() = 0;

  virtual std::string Describe() const = 0;
};

class CsvRecordSource final : public RecordSource {
 public:
  explicit CsvRecordSource(std::string path);

  std::vector<model::ScheduleRecord> Load() override;

  std::string Describe() const override {
    return path_;
  }

 private:
  std::string path_;
};

} // namespace cadence::schedule
