#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <tuple>

#include "internal/db/api/repository.hpp"
#include "internal/model/dispatch_state.hpp"
#include "internal/model/schedule_record.hpp"

namespace cadence::dispatch {

struct LedgerKey {
  std::size_t row_index = 0;
  std::string date;
  std::string time;

  static LedgerKey Of(const model::ScheduleRecord& record) {
    return {record.row_index, record.date, record.time};
  }
};

/*
  Set of (row_index, date, time) keys already dispatched in watch mode.

  A key is marked once the record reached a terminal state, published or
  skipped alike, so no record is attempted twice for the same due condition.
*/
class ExecutionLedger {
 public:
  explicit ExecutionLedger(std::shared_ptr<db::Repository> repository = nullptr);

  void Hydrate();

  bool Contains(const LedgerKey& key) const;

  void MarkExecuted(const LedgerKey& key, model::DispatchState outcome);

  // Keys added since construction (hydrated keys excluded).
  std::size_t SessionCount() const {
    return session_count_;
  }

  std::size_t Size() const {
    return executed_.size();
  }

 private:
  using Entry = std::tuple<std::size_t, std::string, std::string>;

  std::shared_ptr<db::Repository> repository_;
  std::set<Entry>                 executed_;
  std::size_t                     session_count_ = 0;
};

} // namespace cadence::dispatch
