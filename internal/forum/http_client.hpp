#pragma once

#include <string>
#include <string_view>

namespace cadence::forum {

/*
  Blocking JSON-over-HTTP client for the forum REST API (libcurl).

  One easy handle per request; no connection reuse, no retries.
*/
class HttpClient {
 public:
  HttpClient(std::string base_url, long timeout_seconds);

  // POSTs `json` to base_url + path and returns the response body.
  // Throws util::ApiError on HTTP status >= 400 and util::PublishError on
  // transport failure. An empty bearer_token sends no Authorization header.
  std::string PostJson(std::string_view path, const std::string& json, const std::string& bearer_token) const;

  const std::string& BaseUrl() const {
    return base_url_;
  }

 private:
  std::string base_url_;
  long        timeout_seconds_;
};

} // namespace cadence::forum
