#include "sqlite_repository.hpp"

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace cadence::db::sqlite {

using cadence::db::ErrorCode;
using cadence::db::Result;
using observability::StringField;

namespace {

model::ReferenceRecord ReadReference(const Statement& st) {
  model::ReferenceRecord r;
  r.ref_key       = st.Text(0);
  r.thread_id     = st.Text(1);
  r.post_id       = st.Text(2);
  r.created_at_ms = st.U64(3);
  return r;
}

} // namespace

class SqliteRepository::WriteLock final : public db::Transaction {
 public:
  explicit WriteLock(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
    db_->Exec("BEGIN IMMEDIATE;");
  }

  ~WriteLock() override {
    if (!open_) return;
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      CADENCE_LOG_WARN("Discarding uncommitted bookkeeping failed", {StringField("path", db_->Path()), StringField("error", e.what())});
    }
  }

  void Commit() override {
    db_->Exec("COMMIT;");
    open_ = false;
  }

  void Rollback() override {
    open_ = false;
    db_->Exec("ROLLBACK;");
  }

  SqliteDB& Db() const {
    return *db_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      open_ = true;
};

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  // (row_index, date, time) is the ledger's idempotency key
  db.Exec(
      "CREATE TABLE IF NOT EXISTS dispatch_ledger ("
      "row_index INTEGER NOT NULL, date TEXT NOT NULL, time TEXT NOT NULL, "
      "outcome TEXT NOT NULL, executed_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (row_index, date, time));");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS reply_reference ("
      "ref_key TEXT PRIMARY KEY, thread_id TEXT NOT NULL, post_id TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL);");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<WriteLock>(db_);
}

SqliteDB& SqliteRepository::DbOf(Transaction& tx) {
  return static_cast<WriteLock&>(tx).Db();
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return Result::Ok();
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLedgerEntry(Transaction& t, const model::LedgerRecord& r) {
  auto& db = DbOf(t);

  Statement st(db.Handle(), "INSERT INTO dispatch_ledger(row_index,date,time,outcome,executed_at_ms) VALUES(?,?,?,?,?);");
  st.Bind(1, r.row_index);
  st.Bind(2, r.date);
  st.Bind(3, r.time);
  st.Bind(4, r.outcome);
  st.Bind(5, r.executed_at_ms);
  return Translate(db.Handle(), st.Step());
}

std::vector<model::LedgerRecord> SqliteRepository::ListLedgerEntries(Transaction& t) {
  Statement st(DbOf(t).Handle(), "SELECT row_index,date,time,outcome,executed_at_ms FROM dispatch_ledger ORDER BY date,time,row_index;");

  std::vector<model::LedgerRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::LedgerRecord r;
    r.row_index      = st.U64(0);
    r.date           = st.Text(1);
    r.time           = st.Text(2);
    r.outcome        = st.Text(3);
    r.executed_at_ms = st.U64(4);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// References
// ------------------------------------------------------------------

Result SqliteRepository::UpsertReference(Transaction& t, const model::ReferenceRecord& r) {
  auto& db = DbOf(t);

  Statement st(db.Handle(),
               "INSERT INTO reply_reference(ref_key,thread_id,post_id,created_at_ms) VALUES(?,?,?,?) "
               "ON CONFLICT(ref_key) DO UPDATE SET thread_id=excluded.thread_id, post_id=excluded.post_id, "
               "created_at_ms=excluded.created_at_ms;");
  st.Bind(1, r.ref_key);
  st.Bind(2, r.thread_id);
  st.Bind(3, r.post_id);
  st.Bind(4, r.created_at_ms);
  return Translate(db.Handle(), st.Step());
}

std::optional<model::ReferenceRecord> SqliteRepository::GetReference(Transaction& t, const std::string& ref_key) {
  Statement st(DbOf(t).Handle(), "SELECT ref_key,thread_id,post_id,created_at_ms FROM reply_reference WHERE ref_key=?;");
  st.Bind(1, ref_key);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadReference(st);
}

std::vector<model::ReferenceRecord> SqliteRepository::ListReferences(Transaction& t) {
  Statement st(DbOf(t).Handle(), "SELECT ref_key,thread_id,post_id,created_at_ms FROM reply_reference ORDER BY ref_key;");

  std::vector<model::ReferenceRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadReference(st));
  }
  return out;
}

} // namespace cadence::db::sqlite
