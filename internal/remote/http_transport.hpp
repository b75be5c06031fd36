#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace purchase::remote {

enum class HttpMethod { kGet, kPost, kPut, kDelete };

const char* ToString(HttpMethod method);

struct HttpRequest {
  HttpMethod                                       method = HttpMethod::kGet;
  std::string                                      url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;

  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  int         status = 0;
  std::string body;
};

/*
  Raised when no HTTP response was obtained at all: DNS, connect, TLS,
  timeouts. Any response with a status code is returned, never thrown.
*/
class TransportError : public std::runtime_error {
 public:
  TransportError(const std::string& msg, bool timed_out) : std::runtime_error(msg), timed_out_(timed_out) {
  }

  bool TimedOut() const {
    return timed_out_;
  }

 private:
  bool timed_out_;
};

/*
  Generic request/response primitive. Implementations must be safe to
  call from several threads at once.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

} // namespace purchase::remote
