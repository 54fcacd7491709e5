#pragma once

namespace cadence::db {

/*
  Scope of one bookkeeping write (a ledger entry or a reply reference) or of
  a hydration read.

  Writes are visible inside the scope at once and to everyone else after
  Commit(). A scope destroyed without Commit() discards its writes.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace cadence::db
