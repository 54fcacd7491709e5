#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace cadence::forum {

namespace {

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

size_t WriteCallback(char* data, size_t size, size_t nmemb, void* userp) {
  auto* out = static_cast<std::string*>(userp);
  out->append(data, size * nmemb);
  return size * nmemb;
}

std::string TrimTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

struct CurlDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

} // namespace

HttpClient::HttpClient(std::string base_url, long timeout_seconds)
    : base_url_(TrimTrailingSlash(std::move(base_url))), timeout_seconds_(timeout_seconds > 0 ? timeout_seconds : 30) {
  EnsureCurlGlobalInit();
}

std::string HttpClient::PostJson(std::string_view path, const std::string& json, const std::string& bearer_token) const {
  std::string url = base_url_;
  if (path.empty() || path.front() != '/') url.push_back('/');
  url.append(path);

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw util::PublishError("curl_easy_init failed");
  }

  curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  if (!bearer_token.empty()) {
    raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + bearer_token).c_str());
  }
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  std::string response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw util::PublishError("Request failed: POST " + url + ": " + curl_easy_strerror(res));
  }

  long code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
  if (code >= 400) {
    throw util::ApiError("API request failed: " + std::to_string(code) + " POST " + url, code, response);
  }
  return response;
}

} // namespace cadence::forum
