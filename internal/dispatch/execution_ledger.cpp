#include "execution_ledger.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace cadence::dispatch {

using observability::IntField;
using observability::StringField;

ExecutionLedger::ExecutionLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void ExecutionLedger::Hydrate() {
  if (!repository_) return;

  auto       tx      = repository_->Begin();
  const auto records = repository_->ListLedgerEntries(*tx);
  tx->Commit();

  for (const auto& record : records) {
    executed_.emplace(static_cast<std::size_t>(record.row_index), record.date, record.time);
  }
}

bool ExecutionLedger::Contains(const LedgerKey& key) const {
  return executed_.contains(Entry{key.row_index, key.date, key.time});
}

void ExecutionLedger::MarkExecuted(const LedgerKey& key, model::DispatchState outcome) {
  if (!model::IsTerminal(outcome)) {
    throw std::invalid_argument("ledger entries require a terminal dispatch state");
  }
  if (!executed_.emplace(key.row_index, key.date, key.time).second) return;
  ++session_count_;

  if (!repository_) return;

  db::model::LedgerRecord row;
  row.row_index      = key.row_index;
  row.date           = key.date;
  row.time           = key.time;
  row.outcome        = std::string(model::ToString(outcome));
  row.executed_at_ms = util::NowUnixMillis();

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertLedgerEntry(*tx, row);
    if (result || result.code == db::ErrorCode::AlreadyExists) {
      tx->Commit();
    } else {
      CADENCE_LOG_ERROR("Failed to persist ledger entry",
                        {IntField("row_index", static_cast<std::int64_t>(key.row_index)), StringField("error", result.message)});
    }
  } catch (const std::exception& e) {
    CADENCE_LOG_ERROR("Failed to persist ledger entry",
                      {IntField("row_index", static_cast<std::int64_t>(key.row_index)), StringField("error", e.what())});
  }
}

} // namespace cadence::dispatch
