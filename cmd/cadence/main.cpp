#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/outline/outline_parser.hpp"
#include "internal/schedule/record_table.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using cadence::observability::IntField;
using cadence::observability::StringField;

namespace {

constexpr const char* kDefaultConfigPath = "config/cadence.yaml";

std::atomic<bool> g_stop{false};

void HandleSignal(int) {
  g_stop.store(true);
}

void Usage() {
  std::cout << "Usage:\n"
            << "  cadence [--config <cadence.yaml>] convert --input <outline.txt> --output <schedule.csv>\n"
            << "                                            --start-date YYYY-MM-DD --community <slug>\n"
            << "  cadence [--config <cadence.yaml>] run-once [--schedule <schedule.csv>] [--date YYYY-MM-DD]\n"
            << "  cadence [--config <cadence.yaml>] watch [--schedule <schedule.csv>]\n"
            << "  cadence [--config <cadence.yaml>] init-forum --communities <communities.yaml>\n"
            << "  cadence [--config <cadence.yaml>] status\n";
}

struct CommandLine {
  std::optional<std::string>         config_path;
  std::string                        command;
  std::map<std::string, std::string> options;
};

// --flag value pairs only; returns nullopt on malformed input.
std::optional<CommandLine> ParseCommandLine(int argc, char** argv) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return std::nullopt;
      }
      const std::string value = argv[++i];
      if (arg == "--config") {
        cli.config_path = value;
      } else {
        cli.options[arg.substr(2)] = value;
      }
    } else if (cli.command.empty()) {
      cli.command = arg;
    } else {
      std::cerr << "unexpected argument: " << arg << "\n";
      return std::nullopt;
    }
  }
  if (cli.command.empty()) return std::nullopt;
  return cli;
}

bool RequireOptions(const CommandLine& cli, std::initializer_list<const char*> allowed, std::initializer_list<const char*> required) {
  for (const auto& [name, _] : cli.options) {
    bool known = false;
    for (const char* candidate : allowed) known = known || name == candidate;
    if (!known) {
      std::cerr << "unknown option --" << name << " for " << cli.command << "\n";
      return false;
    }
  }
  for (const char* name : required) {
    if (!cli.options.contains(name)) {
      std::cerr << cli.command << " requires --" << name << "\n";
      return false;
    }
  }
  return true;
}

cadence::config::v1::RuntimeConfig LoadConfig(const CommandLine& cli) {
  if (cli.config_path) {
    return cadence::config::ConfigLoader::LoadFromYaml(*cli.config_path);
  }
  if (std::filesystem::exists(kDefaultConfigPath)) {
    return cadence::config::ConfigLoader::LoadFromYaml(kDefaultConfigPath);
  }
  cadence::config::v1::RuntimeConfig config;
  cadence::config::ConfigLoader::ApplyDefaults(config);
  return config;
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw cadence::util::ConfigurationError("cannot read " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int Convert(const CommandLine& cli) {
  const auto start_date = cadence::util::ParseDate(cli.options.at("start-date"));
  if (!start_date) {
    std::cerr << "invalid --start-date, expected YYYY-MM-DD\n";
    return 1;
  }

  cadence::outline::OutlineOptions options;
  options.start_date = *start_date;
  options.community  = cli.options.at("community");

  const auto& input   = cli.options.at("input");
  const auto& output  = cli.options.at("output");
  const auto  records = cadence::outline::OutlineParser(options).Parse(ReadFile(input));
  cadence::schedule::WriteRecordsToFile(output, records);

  CADENCE_LOG_INFO("Converted outline",
                   {StringField("input", input), StringField("output", output), IntField("records", static_cast<std::int64_t>(records.size()))});
  return 0;
}

int RunOnce(const CommandLine& cli, cadence::config::v1::RuntimeConfig config) {
  if (cli.options.contains("schedule")) config.mutable_schedule()->set_path(cli.options.at("schedule"));

  std::string date = cadence::util::Today();
  if (cli.options.contains("date")) {
    if (!cadence::util::ParseDate(cli.options.at("date"))) {
      std::cerr << "invalid --date, expected YYYY-MM-DD\n";
      return 1;
    }
    date = cli.options.at("date");
  }

  auto runtime = cadence::factory::BuildDispatchRuntime(config);
  CADENCE_LOG_INFO("Running schedule", {StringField("schedule", config.schedule().path()), StringField("date", date)});
  runtime.dispatcher->RunOnce(date, g_stop);
  return 0;
}

int Watch(const CommandLine& cli, cadence::config::v1::RuntimeConfig config) {
  if (cli.options.contains("schedule")) config.mutable_schedule()->set_path(cli.options.at("schedule"));

  auto runtime = cadence::factory::BuildDispatchRuntime(config);
  CADENCE_LOG_INFO("Press Ctrl+C to stop");
  runtime.dispatcher->RunContinuous(g_stop);
  return 0;
}

int InitForum(const CommandLine& cli, const cadence::config::v1::RuntimeConfig& config) {
  const auto communities = cadence::config::ConfigLoader::LoadCommunitiesFromYaml(cli.options.at("communities"));
  auto       initializer = cadence::factory::BuildForumInitializer(config);
  const auto summary     = initializer->Run(communities);

  CADENCE_LOG_INFO("Provisioning summary", {IntField("communities_created", static_cast<std::int64_t>(summary.communities_created)),
                                            IntField("communities_skipped", static_cast<std::int64_t>(summary.communities_skipped)),
                                            IntField("bots_created", static_cast<std::int64_t>(summary.bots_created))});
  return 0;
}

int Status(const cadence::config::v1::RuntimeConfig& config) {
  cadence::state::StateStore store(config.state().forum_state_path());
  if (!store.Exists()) {
    std::cout << "No forum setup found. Run init-forum first.\n";
    return 0;
  }
  const auto state = store.Load();

  std::cout << "\n=== Forum Setup Status ===\n\n";
  std::cout << "Communities: " << state.communities_size() << "\n";
  for (const auto& [_, community] : state.communities()) {
    std::cout << "  - " << community.name() << " (" << community.slug() << ")\n";
    std::cout << "    Invite code: " << community.invite_code() << "\n";
  }

  std::map<std::string, std::vector<std::string>> by_community;
  for (const auto& [_, bot] : state.bots()) {
    by_community[bot.community_slug().empty() ? "unknown" : bot.community_slug()].push_back(bot.display_name());
  }

  std::cout << "\nBots: " << state.bots_size() << "\n";
  for (const auto& [slug, names] : by_community) {
    std::cout << "  " << slug << ": " << names.size() << " bots\n";
    for (std::size_t i = 0; i < names.size() && i < 5; ++i) {
      std::cout << "    - " << names[i] << "\n";
    }
    if (names.size() > 5) {
      std::cout << "    ... and " << names.size() - 5 << " more\n";
    }
  }

  cadence::state::PostLog post_log(config.state().posted_log_path());
  std::cout << "\nPosted: " << post_log.CountEntries() << " entries\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto cli = ParseCommandLine(argc, argv);
  if (!cli) {
    Usage();
    return 1;
  }

  bool valid = true;
  if (cli->command == "convert") {
    valid = RequireOptions(*cli, {"input", "output", "start-date", "community"}, {"input", "output", "start-date", "community"});
  } else if (cli->command == "run-once") {
    valid = RequireOptions(*cli, {"schedule", "date"}, {});
  } else if (cli->command == "watch") {
    valid = RequireOptions(*cli, {"schedule"}, {});
  } else if (cli->command == "init-forum") {
    valid = RequireOptions(*cli, {"communities"}, {"communities"});
  } else if (cli->command == "status") {
    valid = RequireOptions(*cli, {}, {});
  } else {
    std::cerr << "unknown command: " << cli->command << "\n";
    valid = false;
  }
  if (!valid) {
    Usage();
    return 1;
  }

  int rc = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = LoadConfig(*cli);
    cadence::observability::InitializeLogging(config);

    // Register before dispatching so Ctrl+C always reaches the stop flag.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (cli->command == "convert") {
      rc = Convert(*cli);
    } else if (cli->command == "run-once") {
      rc = RunOnce(*cli, std::move(config));
    } else if (cli->command == "watch") {
      rc = Watch(*cli, std::move(config));
    } else if (cli->command == "init-forum") {
      rc = InitForum(*cli, config);
    } else {
      rc = Status(config);
    }
  } catch (const std::exception& e) {
    CADENCE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    cadence::observability::ShutdownLogging();
    return 2;
  }

  cadence::observability::ShutdownLogging();
  return rc;
}
