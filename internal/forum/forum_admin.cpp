#include "forum_admin.hpp"

#include <google/protobuf/struct.pb.h>

#include "internal/forum/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cadence::forum {

HttpForumAdmin::HttpForumAdmin(std::shared_ptr<HttpClient> http, std::string admin_email, std::string admin_password)
    : http_(std::move(http)), admin_email_(std::move(admin_email)), admin_password_(std::move(admin_password)) {
}

void HttpForumAdmin::Login() {
  v1::LoginRequest request;
  request.set_email(admin_email_);
  request.set_password(admin_password_);

  std::string body;
  try {
    body = http_->PostJson("/auth/login", ToJson(request), "");
  } catch (const util::ApiError& e) {
    throw util::AuthenticationError("Admin login failed: " + std::string(e.what()));
  }

  const auto response = FromJson<v1::LoginResponse>(body, "login");
  if (response.tokens().access_token().empty()) {
    throw util::AuthenticationError("Admin login failed: response carries no access token");
  }
  admin_token_ = response.tokens().access_token();
  CADENCE_LOG_INFO("Admin login successful", {observability::StringField("email", admin_email_)});
}

const std::string& HttpForumAdmin::AdminToken() const {
  if (admin_token_.empty()) {
    throw util::AuthenticationError("admin endpoints require Login() first");
  }
  return admin_token_;
}

v1::CreateCommunityResponse HttpForumAdmin::CreateCommunity(const std::string& type, const std::string& description,
                                                            const std::string& name_style) {
  v1::CreateCommunityRequest request;
  request.set_type(type);
  request.set_description(description);
  request.set_name_style(name_style);

  auto response = FromJson<v1::CreateCommunityResponse>(http_->PostJson("/admin/communities", ToJson(request), AdminToken()),
                                                        "create community");
  if (response.id().empty() || response.slug().empty()) {
    throw util::PublishError("create community response lacks id or slug");
  }
  return response;
}

std::vector<v1::BotAccount> HttpForumAdmin::CreateBots(std::uint32_t count, const std::string& subcommunity_id,
                                                       const google::protobuf::Struct* avatar_rules) {
  v1::CreateBotsRequest request;
  request.set_count(count);
  request.set_subcommunity_id(subcommunity_id);
  if (avatar_rules != nullptr && avatar_rules->fields_size() > 0) {
    *request.mutable_avatar_rules() = *avatar_rules;
  }

  const auto response =
      FromJson<v1::CreateBotsResponse>(http_->PostJson("/admin/bots/batch", ToJson(request), AdminToken()), "create bots");
  return {response.bots().begin(), response.bots().end()};
}

} // namespace cadence::forum
