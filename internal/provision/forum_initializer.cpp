#include "forum_initializer.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace cadence::provision {

using observability::IntField;
using observability::StringField;

ForumInitializer::ForumInitializer(std::shared_ptr<forum::ForumAdmin> admin, std::shared_ptr<state::StateStore> store)
    : admin_(std::move(admin)), store_(std::move(store)) {
  if (!admin_ || !store_) {
    throw std::invalid_argument("forum initializer: missing dependency");
  }
}

std::string ForumInitializer::CommunityKey(std::size_t index) {
  return "community_" + std::to_string(index);
}

std::string ForumInitializer::BotKey(std::size_t community_index, std::size_t bot_index) {
  return CommunityKey(community_index) + "_bot_" + std::to_string(bot_index);
}

ProvisionSummary ForumInitializer::Run(const cadence::config::v1::CommunitiesConfig& communities) {
  CADENCE_LOG_INFO("Initializing forum setup", {IntField("communities", communities.communities_size())});
  admin_->Login();

  auto             state = store_->Load();
  ProvisionSummary summary;

  for (int i = 0; i < communities.communities_size(); ++i) {
    const auto& spec = communities.communities(i);
    if (spec.has_active() && !spec.active()) continue;

    const auto key = CommunityKey(static_cast<std::size_t>(i));
    if (state.communities().count(key) > 0) {
      CADENCE_LOG_INFO("Community already exists, skipping", {StringField("key", key)});
      ++summary.communities_skipped;
      continue;
    }

    const std::string name_style = spec.name_style().empty() ? kDefaultNameStyle : spec.name_style();
    const std::string type       = spec.type().empty() ? kDefaultType : spec.type();

    CADENCE_LOG_INFO("Creating community", {StringField("style", name_style), StringField("type", type)});
    const auto community = admin_->CreateCommunity(type, spec.description(), name_style);
    CADENCE_LOG_INFO("Created community", {StringField("name", community.name()), StringField("slug", community.slug())});

    auto& record = (*state.mutable_communities())[key];
    record.set_id(community.id());
    record.set_name(community.name());
    record.set_slug(community.slug());
    record.set_invite_code(community.invite_code());
    record.set_password(community.password());
    store_->Save(state);
    ++summary.communities_created;

    const std::uint32_t bot_count = spec.bot_count() > 0 ? spec.bot_count() : kDefaultBotCount;
    CADENCE_LOG_INFO("Creating bots", {IntField("count", bot_count), StringField("community", community.name())});
    const auto bots = admin_->CreateBots(bot_count, community.id(), spec.has_avatar_rules() ? &spec.avatar_rules() : nullptr);

    for (std::size_t j = 0; j < bots.size(); ++j) {
      const auto& bot = bots[j];

      auto& bot_record = (*state.mutable_bots())[BotKey(static_cast<std::size_t>(i), j)];
      bot_record.set_id(bot.id());
      bot_record.set_display_name(bot.display_name());
      bot_record.set_email(bot.email());
      bot_record.set_community_id(community.id());
      bot_record.set_community_slug(community.slug());

      // personas in the schedule are bot display names
      (*state.mutable_account_mapping())[bot.display_name()] = bot.id();
      if (!bot.access_token().empty()) {
        (*state.mutable_bot_tokens())[bot.id()] = bot.access_token();
      }
    }
    store_->Save(state);
    summary.bots_created += bots.size();
    CADENCE_LOG_INFO("Created bots", {IntField("count", static_cast<std::int64_t>(bots.size()))});
  }

  CADENCE_LOG_INFO("Forum initialization complete", {StringField("state", store_->Path())});
  return summary;
}

} // namespace cadence::provision
