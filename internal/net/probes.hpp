#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace purchase::net {

/*
  External collaborators consulted before every refresh/sync attempt.
  Results are never cached beyond a single attempt.
*/

class ConnectivityProbe {
 public:
  virtual ~ConnectivityProbe() = default;

  virtual bool IsOnline() = 0;
};

class AuthProvider {
 public:
  virtual ~AuthProvider() = default;

  virtual bool IsAuthenticated() = 0;

  // opaque bearer credential; empty when not authenticated
  virtual std::string BearerToken() = 0;
};

// Fixed answer, flipped by callers (config force_offline, tests).
class StaticConnectivityProbe final : public ConnectivityProbe {
 public:
  explicit StaticConnectivityProbe(bool online) : online_(online) {
  }

  bool IsOnline() override {
    return online_.load();
  }

  void SetOnline(bool online) {
    online_.store(online);
  }

 private:
  std::atomic<bool> online_;
};

// TCP/TLS connect to the probe URL without sending a request.
class CurlConnectivityProbe final : public ConnectivityProbe {
 public:
  CurlConnectivityProbe(std::string url, std::chrono::milliseconds timeout);

  bool IsOnline() override;

 private:
  std::string               url_;
  std::chrono::milliseconds timeout_;
};

/*
  Token from config or from an environment variable read on every call,
  so a token rotated by the login flow is picked up without restart.
*/
class StaticTokenAuthProvider final : public AuthProvider {
 public:
  StaticTokenAuthProvider(std::string token, std::string env_var);

  bool        IsAuthenticated() override;
  std::string BearerToken() override;

 private:
  std::string token_;
  std::string env_var_;
};

} // namespace purchase::net
