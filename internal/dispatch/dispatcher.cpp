#include "dispatcher.hpp"

#include <exception>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cadence::dispatch {

using model::DispatchState;
using observability::IntField;
using observability::StringField;

namespace {

DispatchState Advance(DispatchState from, DispatchState to) {
  if (!model::CanTransition(from, to)) {
    throw std::logic_error("invalid dispatch transition " + std::string(model::ToString(from)) + " -> " + std::string(model::ToString(to)));
  }
  return to;
}

std::string Preview(const std::string& text) {
  constexpr std::size_t kMax = 50;
  return text.size() <= kMax ? text : text.substr(0, kMax) + "...";
}

void Tally(RunSummary& summary, DispatchState state) {
  if (state == DispatchState::kPublished) {
    ++summary.published;
  } else {
    ++summary.skipped;
  }
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<schedule::RecordSource> source, std::shared_ptr<identity::CredentialStore> credentials,
                       std::shared_ptr<forum::Publisher> publisher, std::shared_ptr<ReplyResolver> resolver,
                       std::shared_ptr<ExecutionLedger> ledger, std::shared_ptr<state::PostLog> post_log,
                       std::shared_ptr<util::WallClock> clock, std::shared_ptr<util::RandomSource> random, DispatchOptions options)
    : source_(std::move(source)),
      credentials_(std::move(credentials)),
      publisher_(std::move(publisher)),
      resolver_(std::move(resolver)),
      ledger_(std::move(ledger)),
      post_log_(std::move(post_log)),
      clock_(std::move(clock)),
      random_(std::move(random)),
      options_(options) {
  if (!source_ || !credentials_ || !publisher_ || !resolver_ || !ledger_ || !clock_ || !random_) {
    throw std::invalid_argument("dispatcher: missing dependency");
  }
}

// ------------------------------------------------------------------
// Single record
// ------------------------------------------------------------------

DispatchState Dispatcher::Dispatch(const model::ScheduleRecord& record) {
  auto state = Advance(DispatchState::kPending, DispatchState::kDue);
  state      = Advance(state, DispatchState::kResolving);

  try {
    const auto bot_id     = credentials_->ResolveAccount(record.account);
    const auto credential = credentials_->Credential(bot_id);

    if (record.kind == model::PostKind::kSelf) {
      const auto community = record.community.empty() ? credentials_->CommunityForBot(bot_id) : record.community;

      const auto handle = publisher_->CreateThread(credential, community, record.title, record.body);
      resolver_->RegisterThread(record, handle);
      CADENCE_LOG_INFO("Created thread", {StringField("title", Preview(record.title)), StringField("account", record.account),
                                          StringField("thread_id", handle.thread_id)});
      AppendPostLog(record, handle.thread_id, handle.post_id, "");
    } else {
      const auto target  = resolver_->Resolve(record);
      const auto post_id = publisher_->CreateReply(credential, target.thread_id, record.body, target.parent_post_id);
      resolver_->RegisterReply(record, target.thread_id, post_id);
      CADENCE_LOG_INFO("Created reply", {StringField("account", record.account), StringField("row_id", record.row_id),
                                         StringField("post_id", post_id)});
      AppendPostLog(record, target.thread_id, post_id, target.parent_post_id.value_or(""));
    }
    return Advance(state, DispatchState::kPublished);
  } catch (const util::UnknownAccount& e) {
    CADENCE_LOG_WARN("Unknown account, skipping", {StringField("row_id", record.row_id), StringField("error", e.what())});
  } catch (const util::MissingCredential& e) {
    CADENCE_LOG_WARN("No token for bot, skipping", {StringField("account", record.account), StringField("error", e.what())});
  } catch (const util::UnknownCommunity& e) {
    CADENCE_LOG_WARN("No community for thread, skipping", {StringField("account", record.account), StringField("error", e.what())});
  } catch (const util::UnresolvedReference& e) {
    CADENCE_LOG_WARN("Invalid reply_to reference", {StringField("row_id", record.row_id), StringField("reply_to", record.reply_to),
                                                    StringField("error", e.what())});
  } catch (const util::PublishError& e) {
    CADENCE_LOG_ERROR("Failed to post", {StringField("account", record.account), StringField("row_id", record.row_id),
                                         StringField("error", e.what())});
  } catch (const std::exception& e) {
    CADENCE_LOG_ERROR("Unexpected dispatch failure", {StringField("row_id", record.row_id), StringField("error", e.what())});
  }
  return Advance(state, DispatchState::kSkipped);
}

void Dispatcher::AppendPostLog(const model::ScheduleRecord& record, const std::string& thread_id, const std::string& post_id,
                               const std::string& parent_id) {
  if (!post_log_) return;

  cadence::state::v1::PostLogEntry entry;
  entry.set_timestamp(util::NowIso8601());
  entry.set_type(record.kind == model::PostKind::kSelf ? "thread" : "comment");
  entry.set_account(record.account);
  entry.set_thread_id(thread_id);
  entry.set_post_id(post_id);
  entry.set_parent_id(parent_id);
  entry.set_date(record.date);
  entry.set_time(record.time);
  entry.set_row_id(record.row_id);

  // the post already exists; a log failure must not turn it into a skip
  try {
    post_log_->Append(entry);
  } catch (const std::exception& e) {
    CADENCE_LOG_ERROR("Failed to append post log", {StringField("path", post_log_->Path()), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Single-pass mode
// ------------------------------------------------------------------

RunSummary Dispatcher::RunOnce(const std::string& date, const std::atomic<bool>& stop) {
  const auto records = source_->Load();

  RunSummary summary;
  for (const auto& record : records) {
    if (stop.load()) break;
    if (record.date != date) continue;

    const auto state = Dispatch(record);
    Tally(summary, state);

    if (state == DispatchState::kPublished && options_.sleep_between_posts.count() > 0) {
      clock_->SleepFor(options_.sleep_between_posts);
    }
  }

  CADENCE_LOG_INFO("Schedule run complete", {StringField("date", date), IntField("published", static_cast<std::int64_t>(summary.published)),
                                             IntField("skipped", static_cast<std::int64_t>(summary.skipped))});
  return summary;
}

// ------------------------------------------------------------------
// Continuous mode
// ------------------------------------------------------------------

RunSummary Dispatcher::RunTick(const util::LocalMinute& now, const std::atomic<bool>& stop) {
  std::vector<model::ScheduleRecord> records;
  try {
    records = source_->Load();
  } catch (const std::exception& e) {
    CADENCE_LOG_ERROR("Failed to load schedule", {StringField("source", source_->Describe()), StringField("error", e.what())});
    return {};
  }

  std::vector<std::size_t> due;
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& record = records[i];
    if (record.date == now.date && record.time == now.time && !ledger_->Contains(LedgerKey::Of(record))) {
      due.push_back(i);
    }
  }

  RunSummary summary;
  if (due.empty()) {
    CADENCE_LOG_INFO("No posts due at this time", {StringField("date", now.date), StringField("time", now.time)});
    return summary;
  }

  CADENCE_LOG_INFO("Found posts to execute", {IntField("count", static_cast<std::int64_t>(due.size()))});
  random_->Shuffle(due);

  for (std::size_t n = 0; n < due.size(); ++n) {
    if (stop.load()) break;

    if (n > 0) {
      const double delay = random_->Uniform(options_.jitter_min_seconds, options_.jitter_max_seconds);
      CADENCE_LOG_INFO("Waiting before next post", {StringField("seconds", std::to_string(delay))});
      clock_->SleepFor(std::chrono::milliseconds(static_cast<std::int64_t>(delay * 1000.0)));
      if (stop.load()) break;
    }

    const auto& record = records[due[n]];
    const auto  state  = Dispatch(record);
    ledger_->MarkExecuted(LedgerKey::Of(record), state);
    Tally(summary, state);
  }
  return summary;
}

void Dispatcher::SleepUntilNextMinute(const std::atomic<bool>& stop) {
  const int remaining = 60 - clock_->Now().second;
  CADENCE_LOG_INFO("Sleeping until next check", {IntField("seconds", remaining)});

  for (int s = 0; s < remaining && !stop.load(); ++s) {
    clock_->SleepFor(std::chrono::seconds(1));
  }
}

std::size_t Dispatcher::RunContinuous(const std::atomic<bool>& stop) {
  CADENCE_LOG_INFO("Starting watch mode", {StringField("source", source_->Describe())});

  while (!stop.load()) {
    const auto now = clock_->Now();
    CADENCE_LOG_INFO("Checking for scheduled posts", {StringField("date", now.date), StringField("time", now.time)});

    RunTick(now, stop);
    if (stop.load()) break;
    SleepUntilNextMinute(stop);
  }

  CADENCE_LOG_INFO("Watch mode stopped", {IntField("executed", static_cast<std::int64_t>(ledger_->SessionCount()))});
  return ledger_->SessionCount();
}

} // namespace cadence::dispatch
