#pragma once

#include <memory>

#include "internal/forum/http_client.hpp"
#include "internal/forum/publisher.hpp"

namespace cadence::forum {

// Publisher over the bot endpoints (POST /bot/threads, POST /bot/posts).
class ForumPublisher final : public Publisher {
 public:
  explicit ForumPublisher(std::shared_ptr<HttpClient> http);

  ThreadHandle CreateThread(const BotCredential& credential, const std::string& community_slug, const std::string& title,
                            const std::string& body) override;

  std::string CreateReply(const BotCredential& credential, const std::string& thread_id, const std::string& body,
                          const std::optional<std::string>& parent_post_id) override;

 private:
  std::shared_ptr<HttpClient> http_;
};

} // namespace cadence::forum
