#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"

namespace cadence::db::sqlite {

/*
  Durable bookkeeping: dispatch_ledger and reply_reference tables.

  A transaction is BEGIN IMMEDIATE .. COMMIT, so a second scheduler process
  on the same file waits for the write lock in Begin() rather than failing at
  COMMIT. Statements that fail to prepare throw std::runtime_error.
*/
class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the tables when missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertLedgerEntry(Transaction&, const model::LedgerRecord&) override;
  std::vector<model::LedgerRecord> ListLedgerEntries(Transaction&) override;

  Result                                UpsertReference(Transaction&, const model::ReferenceRecord&) override;
  std::optional<model::ReferenceRecord> GetReference(Transaction&, const std::string&) override;
  std::vector<model::ReferenceRecord>   ListReferences(Transaction&) override;

 private:
  class WriteLock;

  static SqliteDB& DbOf(Transaction& tx);
  static Result    Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace cadence::db::sqlite
