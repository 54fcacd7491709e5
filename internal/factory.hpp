#pragma once

#include <memory>
#include <string>

#include "cadence/config/v1/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/provision/forum_initializer.hpp"

namespace cadence::factory {

/*
  DispatchRuntime

  Everything run-once / watch need. Lives for the duration of the command.
*/
struct DispatchRuntime {
  std::shared_ptr<db::Repository>            repository;  // null without a durable backend
  std::shared_ptr<dispatch::ReplyResolver>   resolver;
  std::shared_ptr<dispatch::ExecutionLedger> ledger;
  std::shared_ptr<dispatch::Dispatcher>      dispatcher;
};

/*
  Composition root.

  This is the ONLY place allowed to know concrete backend, publisher, clock
  and randomness types.
*/
// Null for the memory backend.
std::shared_ptr<db::Repository> BuildRepository(const cadence::config::v1::RuntimeConfig& config);

// Throws util::ConfigurationError when the forum state is invalid or holds no
// bots, or when the schedule is missing or malformed.
DispatchRuntime BuildDispatchRuntime(const cadence::config::v1::RuntimeConfig& config);

std::unique_ptr<provision::ForumInitializer> BuildForumInitializer(const cadence::config::v1::RuntimeConfig& config);

} // namespace cadence::factory
