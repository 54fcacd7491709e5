#pragma once

#include <optional>
#include <string>

namespace cadence::forum {

// Bot identity used to authenticate a publish call.
struct BotCredential {
  std::string bot_id;
  std::string access_token;
};

struct ThreadHandle {
  std::string thread_id;
  std::string post_id;  // the thread's opening post
};

/*
  Publishing side of the forum API.

  Implementations raise util::PublishError (or a subclass) on any transport
  failure or error status; they never retry.
*/
class Publisher {
 public:
  virtual ~Publisher() = default;

  virtual ThreadHandle CreateThread(const BotCredential& credential, const std::string& community_slug, const std::string& title,
                                    const std::string& body) = 0;

  // Returns the new post id. parent_post_id absent means a top-level reply.
  virtual std::string CreateReply(const BotCredential& credential, const std::string& thread_id, const std::string& body,
                                  const std::optional<std::string>& parent_post_id) = 0;
};

} // namespace cadence::forum
