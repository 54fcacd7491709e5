#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/ledger_record.hpp"
#include "internal/db/model/reference_record.hpp"

namespace cadence::db {

/*
  Repository abstraction for dispatch bookkeeping.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Ledger entries are append-only; re-inserting a key returns AlreadyExists
  - A reference upsert replaces the identifiers stored under its key

  The in-process ExecutionLedger / ReplyResolver are caches over this.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Execution ledger
  // ---------------------------------------------------------------------

  virtual Result InsertLedgerEntry(Transaction&, const model::LedgerRecord&) = 0;

  virtual std::vector<model::LedgerRecord> ListLedgerEntries(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Reply references
  // ---------------------------------------------------------------------

  virtual Result UpsertReference(Transaction&, const model::ReferenceRecord&) = 0;

  virtual std::optional<model::ReferenceRecord> GetReference(Transaction&, const std::string& ref_key) = 0;

  virtual std::vector<model::ReferenceRecord> ListReferences(Transaction&) = 0;
};

} // namespace cadence::db
