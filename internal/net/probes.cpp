#include "probes.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/remote/curl_transport.hpp"

namespace purchase::net {

CurlConnectivityProbe::CurlConnectivityProbe(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
  remote::EnsureCurlGlobalInit();
}

bool CurlConnectivityProbe::IsOnline() {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) return false;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_CONNECT_ONLY, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    PURCHASE_LOG_DEBUG("Connectivity probe failed",
                       {observability::StringField("url", url_), observability::StringField("error", curl_easy_strerror(rc))});
    return false;
  }
  return true;
}

StaticTokenAuthProvider::StaticTokenAuthProvider(std::string token, std::string env_var)
    : token_(std::move(token)), env_var_(std::move(env_var)) {
}

bool StaticTokenAuthProvider::IsAuthenticated() {
  return !BearerToken().empty();
}

std::string StaticTokenAuthProvider::BearerToken() {
  if (!token_.empty()) return token_;
  if (!env_var_.empty()) {
    if (const char* value = std::getenv(env_var_.c_str())) return value;
  }
  return {};
}

} // namespace purchase::net
