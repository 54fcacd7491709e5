#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/ledger_record.hpp"
#include "internal/db/model/reference_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/dispatch/execution_ledger.hpp"
#include "internal/dispatch/reply_resolver.hpp"

namespace {

using cadence::db::ErrorCode;
using cadence::db::Repository;
using cadence::db::memory::MemoryRepository;
using cadence::db::model::LedgerRecord;
using cadence::db::model::ReferenceRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void VerifyLedgerInsertIsIdempotent(Repository& repo) {
  auto tx = repo.Begin();

  LedgerRecord entry{.row_index = 3, .date = "2026-03-01", .time = "10:05", .outcome = "published", .executed_at_ms = NowMs()};
  assert(repo.InsertLedgerEntry(*tx, entry));

  auto again = repo.InsertLedgerEntry(*tx, entry);
  assert(!again);
  assert(again.code == ErrorCode::AlreadyExists);

  // same row, other due condition
  LedgerRecord moved = entry;
  moved.time         = "10:10";
  assert(repo.InsertLedgerEntry(*tx, moved));

  auto entries = repo.ListLedgerEntries(*tx);
  assert(entries.size() == 2);
  tx->Commit();
}

void VerifyReferenceUpsert(Repository& repo) {
  auto tx = repo.Begin();

  ReferenceRecord thread{.ref_key = "garden|2026-03-01|0", .thread_id = "t-1", .post_id = "p-1", .created_at_ms = NowMs()};
  assert(repo.UpsertReference(*tx, thread));

  auto fetched = repo.GetReference(*tx, thread.ref_key);
  assert(fetched.has_value());
  assert(fetched->thread_id == "t-1");
  assert(fetched->post_id == "p-1");

  thread.thread_id = "t-2";
  thread.post_id   = "p-2";
  assert(repo.UpsertReference(*tx, thread));

  fetched = repo.GetReference(*tx, thread.ref_key);
  assert(fetched.has_value());
  assert(fetched->thread_id == "t-2");
  assert(!repo.GetReference(*tx, "garden|2026-03-01|1").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto            tx = repo.Begin();
    ReferenceRecord ref{.ref_key = "rollback|2026-03-02|0", .thread_id = "t", .post_id = "p", .created_at_ms = NowMs()};
    assert(repo.UpsertReference(*tx, ref));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetReference(*check_tx, "rollback|2026-03-02|0").has_value());
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    cadence::dispatch::ExecutionLedger ledger(repo);
    cadence::dispatch::ReplyResolver   resolver(repo);

    cadence::model::ScheduleRecord thread;
    thread.date      = "2026-03-05";
    thread.time      = "10:00";
    thread.row_id    = "0";
    thread.kind      = cadence::model::PostKind::kSelf;
    thread.community = "garden";
    thread.row_index = 0;

    resolver.RegisterThread(thread, {"thread-9", "post-9"});
    ledger.MarkExecuted(cadence::dispatch::LedgerKey::Of(thread), cadence::model::DispatchState::kPublished);
    assert(ledger.SessionCount() == 1);
  }

  backend.restart(repo);

  cadence::dispatch::ExecutionLedger ledger(repo);
  cadence::dispatch::ReplyResolver   resolver(repo);
  ledger.Hydrate();
  resolver.Hydrate();

  assert(ledger.Size() == 1);
  assert(ledger.SessionCount() == 0);
  assert(ledger.Contains({0, "2026-03-05", "10:00"}));
  assert(resolver.Size() == 1);

  cadence::model::ScheduleRecord reply;
  reply.date      = "2026-03-05";
  reply.row_id    = "1";
  reply.reply_to  = "0";
  reply.community = "garden";
  auto target     = resolver.Resolve(reply);
  assert(target.thread_id == "thread-9");
  assert(!target.parent_post_id.has_value());
}

// Transactions opened side by side in one process only journal their writes.
void VerifyMemoryJournalsCommitSideBySide() {
  MemoryRepository repo;

  auto first  = repo.Begin();
  auto second = repo.Begin();
  auto late   = repo.Begin();

  LedgerRecord a{.row_index = 1, .date = "2026-03-03", .time = "10:00", .outcome = "published", .executed_at_ms = NowMs()};
  LedgerRecord b{.row_index = 2, .date = "2026-03-03", .time = "10:05", .outcome = "skipped", .executed_at_ms = NowMs()};
  assert(repo.InsertLedgerEntry(*first, a));
  assert(repo.InsertLedgerEntry(*second, b));
  assert(repo.UpsertReference(*second, {.ref_key = "garden|2026-03-03|0", .thread_id = "t", .post_id = "p", .created_at_ms = NowMs()}));

  // writes stay inside their own transaction until commit
  assert(repo.ListLedgerEntries(*first).size() == 1);
  assert(!repo.GetReference(*first, "garden|2026-03-03|0").has_value());

  first->Commit();
  second->Commit();

  auto again = repo.InsertLedgerEntry(*late, a);
  assert(again.code == ErrorCode::AlreadyExists);

  {
    auto abandoned = repo.Begin();
    LedgerRecord c{.row_index = 3, .date = "2026-03-03", .time = "10:10", .outcome = "published", .executed_at_ms = NowMs()};
    assert(repo.InsertLedgerEntry(*abandoned, c));
  }

  auto check = repo.Begin();
  assert(repo.ListLedgerEntries(*check).size() == 2);
  assert(repo.GetReference(*check, "garden|2026-03-03|0").has_value());
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("cadence_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<cadence::db::sqlite::SqliteDB>(db_path);
    cadence::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<cadence::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyLedgerInsertIsIdempotent(*repo);
    VerifyReferenceUpsert(*repo);
    VerifyRollbackBehavior(*repo);
  }
  backend.cleanup();

  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifyMemoryJournalsCommitSideBySide();

  std::cout << "cadence_integration_repository_parity: pass\n";
  return 0;
}
