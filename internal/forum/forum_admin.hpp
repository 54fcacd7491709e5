#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "cadence/forum/v1/forum_api.pb.h"
#include "internal/forum/http_client.hpp"

namespace google::protobuf {
class Struct;
}

namespace cadence::forum {

/*
  Admin side of the forum API, used only for provisioning.
*/
class ForumAdmin {
 public:
  virtual ~ForumAdmin() = default;

  // Throws util::AuthenticationError when the credentials are rejected.
  virtual void Login() = 0;

  virtual cadence::forum::v1::CreateCommunityResponse CreateCommunity(const std::string& type, const std::string& description,
                                                                      const std::string& name_style) = 0;

  // avatar_rules may be null.
  virtual std::vector<cadence::forum::v1::BotAccount> CreateBots(std::uint32_t count, const std::string& subcommunity_id,
                                                                 const google::protobuf::Struct* avatar_rules) = 0;
};

class HttpForumAdmin final : public ForumAdmin {
 public:
  HttpForumAdmin(std::shared_ptr<HttpClient> http, std::string admin_email, std::string admin_password);

  void Login() override;

  cadence::forum::v1::CreateCommunityResponse CreateCommunity(const std::string& type, const std::string& description,
                                                              const std::string& name_style) override;

  std::vector<cadence::forum::v1::BotAccount> CreateBots(std::uint32_t count, const std::string& subcommunity_id,
                                                         const google::protobuf::Struct* avatar_rules) override;

 private:
  const std::string& AdminToken() const;

  std::shared_ptr<HttpClient> http_;
  std::string                 admin_email_;
  std::string                 admin_password_;
  std::string                 admin_token_;
};

} // namespace cadence::forum
