#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "cadence/config/v1/config.pb.h"
#include "internal/forum/forum_admin.hpp"
#include "internal/state/state_store.hpp"

namespace cadence::provision {

struct ProvisionSummary {
  std::size_t communities_created = 0;
  std::size_t communities_skipped = 0;
  std::size_t bots_created        = 0;
};

/*
  ForumInitializer

  Creates one community per active CommunitySpec and its batch of bots, and
  records them in the forum state under "community_<i>" and
  "community_<i>_bot_<j>". <i> is the entry's position in the list, so reruns
  skip communities that already exist and resume after a partial failure.

  The state is saved after every community and after every bot batch.
*/
class ForumInitializer {
 public:
  static constexpr const char* kDefaultNameStyle = "nature";
  static constexpr const char* kDefaultType      = "INVITE_ONLY";
  static constexpr std::uint32_t kDefaultBotCount = 10;

  ForumInitializer(std::shared_ptr<forum::ForumAdmin> admin, std::shared_ptr<state::StateStore> store);

  ProvisionSummary Run(const cadence::config::v1::CommunitiesConfig& communities);

  static std::string CommunityKey(std::size_t index);
  static std::string BotKey(std::size_t community_index, std::size_t bot_index);

 private:
  std::shared_ptr<forum::ForumAdmin>  admin_;
  std::shared_ptr<state::StateStore>  store_;
};

} // namespace cadence::provision
