#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "internal/dispatch/execution_ledger.hpp"
#include "internal/dispatch/reply_resolver.hpp"
#include "internal/forum/publisher.hpp"
#include "internal/identity/credential_store.hpp"
#include "internal/model/dispatch_state.hpp"
#include "internal/model/schedule_record.hpp"
#include "internal/schedule/record_source.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/random.hpp"
#include "internal/util/time.hpp"

namespace cadence::dispatch {

struct DispatchOptions {
  // run-once: pause after every successful publish
  std::chrono::milliseconds sleep_between_posts{3000};

  // watch: random pause between consecutive records of one due batch
  double jitter_min_seconds = 2.0;
  double jitter_max_seconds = 7.0;
};

struct RunSummary {
  std::size_t published = 0;
  std::size_t skipped   = 0;
};

/*
  Dispatcher

  Drives schedule records through Pending -> Due -> Resolving ->
  {Published | Skipped}. Every per-record failure is caught in Dispatch() and
  turns the record into a skip; the loops never stop on one.

  Single-threaded: the resolver and ledger are owned by the calling loop.
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<schedule::RecordSource> source, std::shared_ptr<identity::CredentialStore> credentials,
             std::shared_ptr<forum::Publisher> publisher, std::shared_ptr<ReplyResolver> resolver, std::shared_ptr<ExecutionLedger> ledger,
             std::shared_ptr<state::PostLog> post_log, std::shared_ptr<util::WallClock> clock, std::shared_ptr<util::RandomSource> random,
             DispatchOptions options);

  // Single pass over the records dated `date`, in table order. No ledger.
  RunSummary RunOnce(const std::string& date, const std::atomic<bool>& stop);

  // One watch-mode tick for the minute `now`.
  RunSummary RunTick(const util::LocalMinute& now, const std::atomic<bool>& stop);

  // Ticks once per minute until `stop` is set. Returns the ledger entries added.
  std::size_t RunContinuous(const std::atomic<bool>& stop);

  // Publishes one record; returns its terminal state.
  model::DispatchState Dispatch(const model::ScheduleRecord& record);

 private:
  void SleepUntilNextMinute(const std::atomic<bool>& stop);
  void AppendPostLog(const model::ScheduleRecord& record, const std::string& thread_id, const std::string& post_id,
                     const std::string& parent_id);

  std::shared_ptr<schedule::RecordSource>    source_;
  std::shared_ptr<identity::CredentialStore> credentials_;
  std::shared_ptr<forum::Publisher>          publisher_;
  std::shared_ptr<ReplyResolver>             resolver_;
  std::shared_ptr<ExecutionLedger>           ledger_;
  std::shared_ptr<state::PostLog>            post_log_;
  std::shared_ptr<util::WallClock>           clock_;
  std::shared_ptr<util::RandomSource>        random_;
  DispatchOptions                            options_;
};

} // namespace cadence::dispatch
