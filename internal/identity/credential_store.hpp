#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "cadence/state/v1/forum_state.pb.h"
#include "internal/forum/publisher.hpp"

namespace cadence::identity {

/*
  Persona -> bot -> token lookup over a provisioned ForumState.

  Immutable after construction.
*/
class CredentialStore {
 public:
  explicit CredentialStore(const cadence::state::v1::ForumState& state);

  // Throws util::UnknownAccount.
  std::string ResolveAccount(const std::string& account) const;

  // Throws util::MissingCredential.
  forum::BotCredential Credential(const std::string& bot_id) const;

  // Slug of the community the bot was provisioned into. Throws util::UnknownCommunity.
  std::string CommunityForBot(const std::string& bot_id) const;

  std::size_t BotCount() const {
    return bot_communities_.size();
  }

 private:
  std::unordered_map<std::string, std::string> account_to_bot_;
  std::unordered_map<std::string, std::string> bot_tokens_;
  std::unordered_map<std::string, std::string> bot_communities_;
};

} // namespace cadence::identity
