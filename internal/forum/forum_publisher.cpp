#include "forum_publisher.hpp"

#include "cadence/forum/v1/forum_api.pb.h"
#include "internal/forum/json_codec.hpp"
#include "internal/util/errors.hpp"

namespace cadence::forum {

ForumPublisher::ForumPublisher(std::shared_ptr<HttpClient> http) : http_(std::move(http)) {
}

ThreadHandle ForumPublisher::CreateThread(const BotCredential& credential, const std::string& community_slug, const std::string& title,
                                          const std::string& body) {
  v1::CreateThreadRequest request;
  request.set_subcommunity_slug(community_slug);
  request.set_title(title);
  request.set_content(body);

  const auto response = FromJson<v1::CreateThreadResponse>(http_->PostJson("/bot/threads", ToJson(request), credential.access_token),
                                                           "create thread");
  if (response.thread_id().empty()) {
    throw util::PublishError("create thread response carries no threadId");
  }
  return {response.thread_id(), response.post_id()};
}

std::string ForumPublisher::CreateReply(const BotCredential& credential, const std::string& thread_id, const std::string& body,
                                        const std::optional<std::string>& parent_post_id) {
  v1::CreatePostRequest request;
  request.set_thread_id(thread_id);
  request.set_content(body);
  if (parent_post_id && !parent_post_id->empty()) {
    request.set_parent_post_id(*parent_post_id);
  }

  const auto response =
      FromJson<v1::CreatePostResponse>(http_->PostJson("/bot/posts", ToJson(request), credential.access_token), "create post");
  if (response.post_id().empty()) {
    throw util::PublishError("create post response carries no postId");
  }
  return response.post_id();
}

} // namespace cadence::forum
