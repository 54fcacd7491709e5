#include "internal/dispatch/reply_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/execution_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using cadence::dispatch::ExecutionLedger;
using cadence::dispatch::LedgerKey;
using cadence::dispatch::ReplyResolver;
using cadence::model::DispatchState;
using cadence::model::PostKind;
using cadence::model::ScheduleRecord;

ScheduleRecord Row(const std::string& row_id, const std::string& date = "2026-03-01", const std::string& community = "garden") {
  ScheduleRecord r;
  r.date      = date;
  r.time      = "10:00";
  r.row_id    = row_id;
  r.kind      = cadence::model::KindOf(row_id);
  r.reply_to  = r.kind == PostKind::kSelf ? std::string() : cadence::model::ParentOf(row_id);
  r.community = community;
  return r;
}

template <typename Fn>
bool ThrowsUnresolved(Fn&& fn) {
  try {
    fn();
  } catch (const cadence::util::UnresolvedReference&) {
    return true;
  }
  return false;
}

void TestCommentWithoutThreadIsUnresolved() {
  ReplyResolver resolver;
  assert(ThrowsUnresolved([&] { (void)resolver.Resolve(Row("1")); }));
}

void TestTopLevelCommentOmitsParent() {
  ReplyResolver resolver;
  resolver.RegisterThread(Row("0"), {"t-1", "p-0"});

  auto target = resolver.Resolve(Row("1"));
  assert(target.thread_id == "t-1");
  assert(!target.parent_post_id.has_value());
}

void TestNestedCommentUsesParentPost() {
  ReplyResolver resolver;
  resolver.RegisterThread(Row("0"), {"t-1", "p-0"});
  resolver.RegisterReply(Row("1"), "t-1", "p-1");
  resolver.RegisterReply(Row("1.1"), "t-1", "p-11");

  auto target = resolver.Resolve(Row("1.1.1"));
  assert(target.thread_id == "t-1");
  assert(target.parent_post_id == std::optional<std::string>("p-11"));

  // sibling whose parent never published
  assert(ThrowsUnresolved([&] { (void)resolver.Resolve(Row("2.1")); }));
  assert(resolver.Size() == 3);
}

void TestReferencesAreScopedByDateAndCommunity() {
  ReplyResolver resolver;
  resolver.RegisterThread(Row("0", "2026-03-01", "garden"), {"t-1", "p-0"});

  assert(ThrowsUnresolved([&] { (void)resolver.Resolve(Row("1", "2026-03-02", "garden")); }));
  assert(ThrowsUnresolved([&] { (void)resolver.Resolve(Row("1", "2026-03-01", "kitchen")); }));
  assert(ReplyResolver::Key("garden", "2026-03-01", "1.2") == "garden|2026-03-01|1.2");
}

void TestRegistrationWritesThrough() {
  auto repository = std::make_shared<cadence::db::memory::MemoryRepository>();
  {
    ReplyResolver resolver(repository);
    resolver.RegisterThread(Row("0"), {"t-1", "p-0"});
    resolver.RegisterReply(Row("1"), "t-1", "p-1");
  }

  ReplyResolver hydrated(repository);
  hydrated.Hydrate();
  assert(hydrated.Size() == 2);
  assert(hydrated.Resolve(Row("1.1")).parent_post_id == std::optional<std::string>("p-1"));
}

void TestLedgerMarksOnceAndPersists() {
  auto repository = std::make_shared<cadence::db::memory::MemoryRepository>();

  ExecutionLedger ledger(repository);
  const LedgerKey key{4, "2026-03-01", "10:20"};
  assert(!ledger.Contains(key));

  ledger.MarkExecuted(key, DispatchState::kSkipped);
  ledger.MarkExecuted(key, DispatchState::kSkipped);
  assert(ledger.Contains(key));
  assert(ledger.SessionCount() == 1);

  // the same row at another time is a different due condition
  assert(!ledger.Contains({4, "2026-03-01", "10:25"}));

  ExecutionLedger hydrated(repository);
  hydrated.Hydrate();
  assert(hydrated.Contains(key));
  assert(hydrated.SessionCount() == 0);
}

void TestLedgerRejectsNonTerminalState() {
  ExecutionLedger ledger;
  bool            threw = false;
  try {
    ledger.MarkExecuted({0, "2026-03-01", "10:00"}, DispatchState::kResolving);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Size() == 0);
}

} // namespace

int main() {
  TestCommentWithoutThreadIsUnresolved();
  TestTopLevelCommentOmitsParent();
  TestNestedCommentUsesParentPost();
  TestReferencesAreScopedByDateAndCommunity();
  TestRegistrationWritesThrough();
  TestLedgerMarksOnceAndPersists();
  TestLedgerRejectsNonTerminalState();

  std::cout << "cadence_unit_reply_resolver: pass\n";
  return 0;
}
