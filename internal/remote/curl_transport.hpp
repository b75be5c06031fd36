#pragma once

#include "internal/remote/http_transport.hpp"

namespace purchase::remote {

// curl_global_init exactly once per process.
void EnsureCurlGlobalInit();

/*
  libcurl-backed transport. One easy handle per request, so concurrent
  Send() calls share nothing.
*/
class CurlTransport final : public HttpTransport {
 public:
  CurlTransport();

  HttpResponse Send(const HttpRequest& request) override;
};

} // namespace purchase::remote
