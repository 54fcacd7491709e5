#pragma once

#include <cstdint>
#include <string>

namespace cadence::db::model {

/*
  Platform identifiers assigned to a published row.

  ref_key is "<community>|<date>|<row_id>"; the thread post is row "0".
*/
struct ReferenceRecord {
  std::string ref_key;
  std::string thread_id;
  std::string post_id;

  std::uint64_t created_at_ms = 0;
};

} // namespace cadence::db::model
