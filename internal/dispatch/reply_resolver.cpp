#include "reply_resolver.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cadence::dispatch {

using observability::StringField;

ReplyResolver::ReplyResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string ReplyResolver::Key(std::string_view community, std::string_view date, std::string_view row_id) {
  std::string key;
  key.reserve(community.size() + date.size() + row_id.size() + 2);
  key.append(community).append("|").append(date).append("|").append(row_id);
  return key;
}

void ReplyResolver::Hydrate() {
  if (!repository_) return;

  auto       tx      = repository_->Begin();
  const auto records = repository_->ListReferences(*tx);
  tx->Commit();

  for (const auto& record : records) {
    index_[record.ref_key] = Reference{record.thread_id, record.post_id};
  }
}

ReplyTarget ReplyResolver::Resolve(const model::ScheduleRecord& record) const {
  const auto thread_it = index_.find(Key(record.community, record.date, model::kRootRowId));
  if (thread_it == index_.end()) {
    throw util::UnresolvedReference("thread for " + record.date + " in '" + record.community + "' was never created");
  }

  ReplyTarget target;
  target.thread_id = thread_it->second.thread_id;

  if (record.reply_to.empty() || record.reply_to == model::kRootRowId) {
    return target;
  }

  const auto parent_it = index_.find(Key(record.community, record.date, record.reply_to));
  if (parent_it == index_.end()) {
    throw util::UnresolvedReference("parent row " + record.reply_to + " of " + record.row_id + " on " + record.date +
                                    " was never published");
  }
  target.parent_post_id = parent_it->second.post_id;
  return target;
}

void ReplyResolver::RegisterThread(const model::ScheduleRecord& record, const forum::ThreadHandle& handle) {
  Register(Key(record.community, record.date, model::kRootRowId), Reference{handle.thread_id, handle.post_id});
}

void ReplyResolver::RegisterReply(const model::ScheduleRecord& record, const std::string& thread_id, const std::string& post_id) {
  Register(Key(record.community, record.date, record.row_id), Reference{thread_id, post_id});
}

void ReplyResolver::Register(std::string key, Reference reference) {
  if (repository_) {
    db::model::ReferenceRecord row;
    row.ref_key       = key;
    row.thread_id     = reference.thread_id;
    row.post_id       = reference.post_id;
    row.created_at_ms = util::NowUnixMillis();

    try {
      auto tx     = repository_->Begin();
      auto result = repository_->UpsertReference(*tx, row);
      if (result) {
        tx->Commit();
      } else {
        CADENCE_LOG_ERROR("Failed to persist reply reference", {StringField("key", key), StringField("error", result.message)});
      }
    } catch (const std::exception& e) {
      CADENCE_LOG_ERROR("Failed to persist reply reference", {StringField("key", key), StringField("error", e.what())});
    }
  }

  index_[std::move(key)] = std::move(reference);
}

} // namespace cadence::dispatch
