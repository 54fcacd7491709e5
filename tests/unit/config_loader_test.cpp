#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using cadence::config::ConfigLoader;
using cadence::util::ConfigurationError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cadence_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsConfigurationError(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_scalars",
                                   R"(api:
  base_url: "https://forum.example/api"
  admin_email: "admin@example.com"
  admin_password: "12345"
state:
  forum_state_path: "C:\\cadence\\\"quoted\"\\forum.json"
)");

  ::unsetenv("CADENCE_ADMIN_PASSWORD");
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.api().base_url() == "https://forum.example/api");
  assert(config.api().admin_password() == "12345");
  assert(config.state().forum_state_path() == "C:\\cadence\\\"quoted\"\\forum.json");
}

void TestNumbersAndOneofBackend() {
  const auto yaml_path = WriteYaml("numbers_backend",
                                   R"(api:
  timeout_seconds: 12
dispatch:
  sleep_between_posts_seconds: 0.5
  jitter_min_seconds: 1
  jitter_max_seconds: 4
  random_seed: 99
database:
  sqlite:
    path: "/tmp/cadence/ledger.db"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.api().timeout_seconds() == 12);
  assert(config.dispatch().sleep_between_posts_seconds() == 0.5);
  assert(config.dispatch().jitter_min_seconds() == 1.0);
  assert(config.dispatch().jitter_max_seconds() == 4.0);
  assert(config.dispatch().random_seed() == 99);
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/cadence/ledger.db");
}

void TestDefaultsFillUnsetKnobs() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.api().base_url() == "http://localhost:3000/api");
  assert(config.api().timeout_seconds() == 30);
  assert(config.dispatch().sleep_between_posts_seconds() == 3.0);
  assert(config.dispatch().jitter_min_seconds() == 2.0);
  assert(config.dispatch().jitter_max_seconds() == 7.0);
  assert(config.schedule().path() == "schedules/schedule.csv");
  assert(config.state().forum_state_path() == "state/forum_setup.json");
  assert(config.state().posted_log_path() == "state/posted_log.jsonl");
  assert(!config.database().has_sqlite());

  ConfigLoader::ValidateForDispatch(config);
}

void TestExplicitZeroSleepIsKept() {
  const auto yaml_path = WriteYaml("zero_sleep",
                                   R"(dispatch:
  sleep_between_posts_seconds: 0
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.dispatch().has_sleep_between_posts_seconds());
  assert(config.dispatch().sleep_between_posts_seconds() == 0.0);
  ConfigLoader::ValidateForDispatch(config);

  config.mutable_dispatch()->set_sleep_between_posts_seconds(-1);
  assert(ThrowsConfigurationError([&] { ConfigLoader::ValidateForDispatch(config); }));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(api:
  base_url: "http://localhost:3000/api"
unknown_field: 123
)");

  assert(ThrowsConfigurationError([&] { ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestMissingFileIsAConfigurationError() {
  assert(ThrowsConfigurationError([] { ConfigLoader::LoadFromYaml("/nonexistent/cadence/config.yaml"); }));
}

void TestPasswordEnvironmentOverride() {
  const auto yaml_path = WriteYaml("password_env",
                                   R"(api:
  admin_email: "admin@example.com"
  admin_password: "from-file"
)");

  ::setenv("CADENCE_ADMIN_PASSWORD", "from-env", 1);
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  ::unsetenv("CADENCE_ADMIN_PASSWORD");

  assert(config.api().admin_password() == "from-env");
  ConfigLoader::ValidateForProvisioning(config);
}

void TestProvisioningRequiresAdminCredentials() {
  const auto yaml_path = WriteYaml("no_admin", "api:\n  base_url: \"http://localhost:3000/api\"\n");

  ::unsetenv("CADENCE_ADMIN_PASSWORD");
  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(ThrowsConfigurationError([&] { ConfigLoader::ValidateForProvisioning(config); }));

  config.mutable_api()->set_admin_email("admin@example.com");
  assert(ThrowsConfigurationError([&] { ConfigLoader::ValidateForProvisioning(config); }));

  config.mutable_api()->set_admin_password("secret");
  ConfigLoader::ValidateForProvisioning(config);
}

void TestDispatchValidation() {
  auto config = cadence::config::v1::RuntimeConfig();
  ConfigLoader::ApplyDefaults(config);

  config.mutable_dispatch()->set_jitter_min_seconds(9);
  config.mutable_dispatch()->set_jitter_max_seconds(3);
  assert(ThrowsConfigurationError([&] { ConfigLoader::ValidateForDispatch(config); }));

  config.mutable_dispatch()->set_jitter_max_seconds(9);
  config.mutable_database()->mutable_sqlite();
  assert(ThrowsConfigurationError([&] { ConfigLoader::ValidateForDispatch(config); }));

  config.mutable_database()->mutable_sqlite()->set_path("ledger.db");
  ConfigLoader::ValidateForDispatch(config);
}

void TestCommunitiesConfig() {
  const auto yaml_path = WriteYaml("communities",
                                   R"(communities:
  - name_style: "botanical"
    type: "OPEN"
    description: "Plants and gardens"
    bot_count: 4
    avatar_rules:
      style: "watercolor"
      palette: ["green", "ochre"]
  - name_style: "maritime"
    active: false
)");

  auto config = ConfigLoader::LoadCommunitiesFromYaml(yaml_path.string());
  assert(config.communities_size() == 2);

  const auto& first = config.communities(0);
  assert(first.name_style() == "botanical");
  assert(first.bot_count() == 4);
  assert(!first.has_active());
  assert(first.avatar_rules().fields().at("style").string_value() == "watercolor");
  assert(first.avatar_rules().fields().at("palette").list_value().values_size() == 2);

  const auto& second = config.communities(1);
  assert(second.has_active());
  assert(!second.active());
  assert(second.bot_count() == 0);
}

void TestCommunitiesRejectUnknownKeys() {
  const auto yaml_path = WriteYaml("communities_unknown", "communities:\n  - name_style: \"x\"\n    bots: 3\n");
  assert(ThrowsConfigurationError([&] { ConfigLoader::LoadCommunitiesFromYaml(yaml_path.string()); }));
}

} // namespace

int main() {
  TestQuotedScalarsStayStrings();
  TestNumbersAndOneofBackend();
  TestDefaultsFillUnsetKnobs();
  TestExplicitZeroSleepIsKept();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsAConfigurationError();
  TestPasswordEnvironmentOverride();
  TestProvisioningRequiresAdminCredentials();
  TestDispatchValidation();
  TestCommunitiesConfig();
  TestCommunitiesRejectUnknownKeys();

  std::cout << "cadence_unit_config_loader: pass\n";
  return 0;
}
