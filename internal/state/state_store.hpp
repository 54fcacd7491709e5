#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "cadence/state/v1/forum_state.pb.h"

namespace cadence::state {

/*
  Provisioned forum state as pretty-printed JSON (proto field names).

  Loading is strict: unknown fields, malformed JSON and a schema_version newer
  than kSchemaVersion raise util::ConfigurationError. A missing file loads as
  an empty state.
*/
class StateStore {
 public:
  static constexpr std::uint32_t kSchemaVersion = 1;

  explicit StateStore(std::string path);

  bool Exists() const;

  cadence::state::v1::ForumState Load() const;

  // Writes a temp file next to the target and renames it into place.
  void Save(const cadence::state::v1::ForumState& state) const;

  const std::string& Path() const {
    return path_;
  }

 private:
  std::string path_;
};

// Append-only JSON-lines record of every successful publish.
class PostLog {
 public:
  explicit PostLog(std::string path);

  void Append(const cadence::state::v1::PostLogEntry& entry);

  // Non-blank lines; 0 if the file does not exist.
  std::size_t CountEntries() const;

  const std::string& Path() const {
    return path_;
  }

 private:
  std::string path_;
};

} // namespace cadence::state
