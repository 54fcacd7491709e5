#include "internal/state/state_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "internal/identity/credential_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using cadence::state::PostLog;
using cadence::state::StateStore;

std::filesystem::path TestDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "cadence_state_store_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path);
  out << content;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestMissingFileLoadsEmpty() {
  StateStore store((TestDir("missing") / "forum_setup.json").string());
  assert(!store.Exists());

  auto state = store.Load();
  assert(state.schema_version() == StateStore::kSchemaVersion);
  assert(state.bots().empty());
  assert(state.communities().empty());
}

void TestSaveThenLoad() {
  const auto path = TestDir("save") / "nested" / "forum_setup.json";
  StateStore store(path.string());

  cadence::state::v1::ForumState state;
  auto&                          community = (*state.mutable_communities())["community_0"];
  community.set_id("c-1");
  community.set_slug("garden");
  auto& bot = (*state.mutable_bots())["community_0_bot_0"];
  bot.set_id("b-1");
  bot.set_display_name("Alice");
  bot.set_community_slug("garden");
  (*state.mutable_account_mapping())["Alice"] = "b-1";
  (*state.mutable_bot_tokens())["b-1"]         = "tok";

  store.Save(state);
  assert(store.Exists());
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  auto loaded = store.Load();
  assert(loaded.schema_version() == 1);
  assert(loaded.communities().at("community_0").slug() == "garden");
  assert(loaded.bots().at("community_0_bot_0").display_name() == "Alice");
  assert(loaded.account_mapping().at("Alice") == "b-1");
  assert(loaded.bot_tokens().at("b-1") == "tok");

  // proto field names on disk
  std::ifstream     in(path);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(text.find("\"account_mapping\"") != std::string::npos);
  assert(text.find("\"community_slug\"") != std::string::npos);
}

void TestLegacyFileWithoutVersion() {
  const auto path = TestDir("legacy") / "forum_setup.json";
  WriteFile(path, R"({"communities": {"community_0": {"id": "c-1", "slug": "garden"}}, "account_mapping": {"Alice": "b-1"}})");

  auto state = StateStore(path.string()).Load();
  assert(state.schema_version() == 1);
  assert(state.account_mapping().at("Alice") == "b-1");
}

void TestFutureVersionIsRejected() {
  const auto path = TestDir("future") / "forum_setup.json";
  WriteFile(path, R"({"schema_version": 2})");
  assert(Throws<cadence::util::ConfigurationError>([&] { StateStore(path.string()).Load(); }));
}

void TestUnknownFieldIsRejected() {
  const auto path = TestDir("unknown") / "forum_setup.json";
  WriteFile(path, R"({"schema_version": 1, "bot_passwords": {}})");
  assert(Throws<cadence::util::ConfigurationError>([&] { StateStore(path.string()).Load(); }));
}

void TestMalformedJsonIsRejected() {
  const auto path = TestDir("malformed") / "forum_setup.json";
  WriteFile(path, "{\"communities\": ");
  assert(Throws<cadence::util::ConfigurationError>([&] { StateStore(path.string()).Load(); }));
}

void TestPostLogAppendsLines() {
  const auto path = TestDir("post_log") / "logs" / "posted_log.jsonl";
  PostLog    log(path.string());
  assert(log.CountEntries() == 0);

  cadence::state::v1::PostLogEntry entry;
  entry.set_type("thread");
  entry.set_account("Alice");
  entry.set_thread_id("t-1");
  entry.set_post_id("p-1");
  entry.set_row_id("0");
  log.Append(entry);

  entry.set_type("comment");
  entry.set_post_id("p-2");
  entry.set_parent_id("p-1");
  entry.set_row_id("1");
  log.Append(entry);

  assert(log.CountEntries() == 2);

  std::ifstream in(path);
  std::string   first;
  std::getline(in, first);
  assert(first.find("\"thread_id\":\"t-1\"") != std::string::npos);
}

void TestCredentialStoreLookups() {
  cadence::state::v1::ForumState state;
  auto&                          alice = (*state.mutable_bots())["community_0_bot_0"];
  alice.set_id("b-1");
  alice.set_community_slug("garden");
  auto& bob = (*state.mutable_bots())["community_0_bot_1"];
  bob.set_id("b-2");
  (*state.mutable_account_mapping())["Alice"] = "b-1";
  (*state.mutable_account_mapping())["Bob"]   = "b-2";
  (*state.mutable_bot_tokens())["b-1"]         = "tok-1";
  (*state.mutable_bot_tokens())["b-2"]         = "";

  cadence::identity::CredentialStore store(state);
  assert(store.BotCount() == 2);
  assert(store.ResolveAccount("Alice") == "b-1");
  assert(store.Credential("b-1").access_token == "tok-1");
  assert(store.CommunityForBot("b-1") == "garden");

  assert(Throws<cadence::util::UnknownAccount>([&] { (void)store.ResolveAccount("Carol"); }));
  assert(Throws<cadence::util::MissingCredential>([&] { (void)store.Credential("b-2"); }));
  assert(Throws<cadence::util::UnknownCommunity>([&] { (void)store.CommunityForBot("b-2"); }));
}

} // namespace

int main() {
  TestMissingFileLoadsEmpty();
  TestSaveThenLoad();
  TestLegacyFileWithoutVersion();
  TestFutureVersionIsRejected();
  TestUnknownFieldIsRejected();
  TestMalformedJsonIsRejected();
  TestPostLogAppendsLines();
  TestCredentialStoreLookups();

  std::cout << "cadence_unit_state_store: pass\n";
  return 0;
}
