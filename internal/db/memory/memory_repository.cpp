#include "memory_repository.hpp"

#include <utility>

namespace cadence::db::memory {

struct MemoryRepository::Journal final : public db::Transaction {
  explicit Journal(MemoryRepository& repo) : repo(repo) {
  }

  void Commit() override {
    std::scoped_lock lock(repo.mutex_);
    for (auto& [key, record] : ledger) {
      repo.ledger_.emplace(key, std::move(record));
    }
    for (auto& [key, record] : references) {
      repo.references_[key] = std::move(record);
    }
    Rollback();
  }

  void Rollback() override {
    ledger.clear();
    references.clear();
  }

  MemoryRepository&                             repo;
  std::map<LedgerKey, model::LedgerRecord>      ledger;
  std::map<std::string, model::ReferenceRecord> references;
};

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<Journal>(*this);
}

MemoryRepository::Journal& MemoryRepository::JournalOf(Transaction& tx) {
  return static_cast<Journal&>(tx);
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerRecord& r) {
  auto&     journal = JournalOf(t);
  LedgerKey key{r.row_index, r.date, r.time};

  std::scoped_lock lock(mutex_);
  if (ledger_.contains(key) || journal.ledger.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "ledger entry " + std::to_string(r.row_index) + " " + r.date + " " + r.time + " exists");
  }
  journal.ledger.emplace(std::move(key), r);
  return Result::Ok();
}

std::vector<model::LedgerRecord> MemoryRepository::ListLedgerEntries(Transaction& t) {
  const auto& journal = JournalOf(t);

  std::scoped_lock lock(mutex_);
  auto             merged = ledger_;
  merged.insert(journal.ledger.begin(), journal.ledger.end());

  std::vector<model::LedgerRecord> records;
  records.reserve(merged.size());
  for (auto& [_, record] : merged) {
    records.push_back(std::move(record));
  }
  return records;
}

// ------------------------------------------------------------------
// References
// ------------------------------------------------------------------

Result MemoryRepository::UpsertReference(Transaction& t, const model::ReferenceRecord& r) {
  JournalOf(t).references[r.ref_key] = r;
  return Result::Ok();
}

std::optional<model::ReferenceRecord> MemoryRepository::GetReference(Transaction& t, const std::string& ref_key) {
  const auto& journal = JournalOf(t);
  if (auto it = journal.references.find(ref_key); it != journal.references.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = references_.find(ref_key);
  if (it == references_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ReferenceRecord> MemoryRepository::ListReferences(Transaction& t) {
  const auto& journal = JournalOf(t);

  std::scoped_lock lock(mutex_);
  auto             merged = references_;
  for (const auto& [key, record] : journal.references) {
    merged[key] = record;
  }

  std::vector<model::ReferenceRecord> records;
  records.reserve(merged.size());
  for (auto& [_, record] : merged) {
    records.push_back(std::move(record));
  }
  return records;
}

} // namespace cadence::db::memory
