#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/forum/forum_admin.hpp"
#include "internal/forum/forum_publisher.hpp"
#include "internal/forum/http_client.hpp"
#include "internal/identity/credential_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schedule/record_source.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/random.hpp"
#include "internal/util/time.hpp"

namespace cadence::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const cadence::config::v1::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const std::filesystem::path db_path(database.sqlite().path());
    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  // in-process only: the resolver and ledger keep their own maps
  return nullptr;
}

DispatchRuntime BuildDispatchRuntime(const cadence::config::v1::RuntimeConfig& config) {
  config::ConfigLoader::ValidateForDispatch(config);

  // ------------------------------------------------------------------
  // Identity
  // ------------------------------------------------------------------
  state::StateStore store(config.state().forum_state_path());
  const auto        forum_state = store.Load();
  if (forum_state.bots_size() == 0) {
    throw util::ConfigurationError("No bots found in " + store.Path() + ". Run init-forum first.");
  }
  auto credentials = std::make_shared<identity::CredentialStore>(forum_state);

  // ------------------------------------------------------------------
  // Schedule (must be readable at startup; later ticks tolerate it vanishing)
  // ------------------------------------------------------------------
  auto       source   = std::make_shared<schedule::CsvRecordSource>(config.schedule().path());
  const auto schedule = source->Load();
  CADENCE_LOG_INFO("Schedule loaded", {StringField("source", source->Describe()), IntField("records", static_cast<std::int64_t>(schedule.size()))});

  // ------------------------------------------------------------------
  // Forum API
  // ------------------------------------------------------------------
  auto http      = std::make_shared<forum::HttpClient>(config.api().base_url(), static_cast<long>(config.api().timeout_seconds()));
  auto publisher = std::make_shared<forum::ForumPublisher>(http);

  // ------------------------------------------------------------------
  // Bookkeeping (hydrated from the durable backend when configured)
  // ------------------------------------------------------------------
  DispatchRuntime runtime;
  runtime.repository = BuildRepository(config);
  runtime.resolver   = std::make_shared<dispatch::ReplyResolver>(runtime.repository);
  runtime.ledger     = std::make_shared<dispatch::ExecutionLedger>(runtime.repository);
  runtime.resolver->Hydrate();
  runtime.ledger->Hydrate();

  CADENCE_LOG_INFO("Dispatch state hydrated", {StringField("backend", config.database().has_sqlite() ? "sqlite" : "memory"),
                                               IntField("references", static_cast<std::int64_t>(runtime.resolver->Size())),
                                               IntField("ledger_entries", static_cast<std::int64_t>(runtime.ledger->Size()))});

  // ------------------------------------------------------------------
  // Dispatcher
  // ------------------------------------------------------------------
  const auto& dispatch_config = config.dispatch();
  const auto  seed            = dispatch_config.random_seed() != 0 ? dispatch_config.random_seed() : util::SeedFromDevice();

  dispatch::DispatchOptions options;
  options.sleep_between_posts =
      std::chrono::milliseconds(static_cast<std::int64_t>(dispatch_config.sleep_between_posts_seconds() * 1000.0));
  options.jitter_min_seconds = dispatch_config.jitter_min_seconds();
  options.jitter_max_seconds = dispatch_config.jitter_max_seconds();

  runtime.dispatcher = std::make_shared<dispatch::Dispatcher>(
      std::move(source), std::move(credentials), std::move(publisher),
      runtime.resolver, runtime.ledger, std::make_shared<state::PostLog>(config.state().posted_log_path()),
      std::make_shared<util::SystemWallClock>(), std::make_shared<util::SeededRandom>(seed), options);

  return runtime;
}

std::unique_ptr<provision::ForumInitializer> BuildForumInitializer(const cadence::config::v1::RuntimeConfig& config) {
  config::ConfigLoader::ValidateForProvisioning(config);

  auto http  = std::make_shared<forum::HttpClient>(config.api().base_url(), static_cast<long>(config.api().timeout_seconds()));
  auto admin = std::make_shared<forum::HttpForumAdmin>(http, config.api().admin_email(), config.api().admin_password());
  auto store = std::make_shared<state::StateStore>(config.state().forum_state_path());
  return std::make_unique<provision::ForumInitializer>(std::move(admin), std::move(store));
}

} // namespace cadence::factory
