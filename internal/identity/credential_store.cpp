#include "credential_store.hpp"

#include "internal/util/errors.hpp"

namespace cadence::identity {

CredentialStore::CredentialStore(const cadence::state::v1::ForumState& state) {
  for (const auto& [account, bot_id] : state.account_mapping()) {
    account_to_bot_.emplace(account, bot_id);
  }
  for (const auto& [bot_id, token] : state.bot_tokens()) {
    if (!token.empty()) bot_tokens_.emplace(bot_id, token);
  }
  for (const auto& [_, bot] : state.bots()) {
    bot_communities_.emplace(bot.id(), bot.community_slug());
  }
}

std::string CredentialStore::ResolveAccount(const std::string& account) const {
  auto it = account_to_bot_.find(account);
  if (it == account_to_bot_.end() || it->second.empty()) {
    throw util::UnknownAccount("unknown account: " + account);
  }
  return it->second;
}

forum::BotCredential CredentialStore::Credential(const std::string& bot_id) const {
  auto it = bot_tokens_.find(bot_id);
  if (it == bot_tokens_.end()) {
    throw util::MissingCredential("no access token for bot " + bot_id);
  }
  return {bot_id, it->second};
}

std::string CredentialStore::CommunityForBot(const std::string& bot_id) const {
  auto it = bot_communities_.find(bot_id);
  if (it == bot_communities_.end() || it->second.empty()) {
    throw util::UnknownCommunity("bot " + bot_id + " has no community");
  }
  return it->second;
}

} // namespace cadence::identity
