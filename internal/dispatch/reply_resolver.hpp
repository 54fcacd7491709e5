#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "internal/forum/publisher.hpp"
#include "internal/model/schedule_record.hpp"

namespace cadence::dispatch {

struct ReplyTarget {
  std::string                thread_id;
  std::optional<std::string> parent_post_id;  // absent for top-level comments
};

/*
  Maps (community, date, row_id) to the platform ids assigned when that row was
  published.

  Entries are added only after a successful publish and never removed. Lookups
  are pure; a missing entry is reported as util::UnresolvedReference, the
  resolver never waits for it to appear.
*/
class ReplyResolver {
 public:
  // repository may be null: the index then lives only for the process.
  explicit ReplyResolver(std::shared_ptr<db::Repository> repository = nullptr);

  // Loads references registered by earlier processes.
  void Hydrate();

  ReplyTarget Resolve(const model::ScheduleRecord& record) const;

  void RegisterThread(const model::ScheduleRecord& record, const forum::ThreadHandle& handle);
  void RegisterReply(const model::ScheduleRecord& record, const std::string& thread_id, const std::string& post_id);

  std::size_t Size() const {
    return index_.size();
  }

  static std::string Key(std::string_view community, std::string_view date, std::string_view row_id);

 private:
  struct Reference {
    std::string thread_id;
    std::string post_id;
  };

  void Register(std::string key, Reference reference);

  std::shared_ptr<db::Repository>            repository_;
  std::unordered_map<std::string, Reference> index_;
};

} // namespace cadence::dispatch
