#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>

#include "internal/db/api/repository.hpp"

namespace cadence::db::memory {

/*
  Process-lifetime repository; nothing survives the process.

  Each transaction journals its writes and applies them under the lock on
  Commit(). Two journals inserting the same ledger key both see Ok until
  the first commit; the second commit leaves the first entry in place.
*/
class MemoryRepository final : public db::Repository {
 public:
  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertLedgerEntry(Transaction&, const model::LedgerRecord&) override;
  std::vector<model::LedgerRecord> ListLedgerEntries(Transaction&) override;

  Result                                UpsertReference(Transaction&, const model::ReferenceRecord&) override;
  std::optional<model::ReferenceRecord> GetReference(Transaction&, const std::string&) override;
  std::vector<model::ReferenceRecord>   ListReferences(Transaction&) override;

 private:
  struct Journal;

  using LedgerKey = std::tuple<std::uint64_t, std::string, std::string>;

  static Journal& JournalOf(Transaction& tx);

  std::mutex                                    mutex_;
  std::map<LedgerKey, model::LedgerRecord>      ledger_;
  std::map<std::string, model::ReferenceRecord> references_;
};

} // namespace cadence::db::memory
