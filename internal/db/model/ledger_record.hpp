#pragma once

#include <cstdint>
#include <string>

namespace cadence::db::model {

/*
  One executed (published or skipped) schedule row.

  (row_index, date, time) is the idempotency key.
*/
struct LedgerRecord {
  std::uint64_t row_index = 0;
  std::string   date;
  std::string   time;

  std::string   outcome;  // "published" | "skipped"
  std::uint64_t executed_at_ms = 0;
};

} // namespace cadence::db::model
