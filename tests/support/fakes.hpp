#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/net/probes.hpp"
#include "internal/remote/http_transport.hpp"
#include "internal/remote/purchase_api.hpp"

namespace purchase::testing {

inline constexpr const char* kBaseUrl = "http://erp.test";
inline constexpr const char* kApiRoot = "http://erp.test/connector/api";

/*
  Route-scripted transport. Routes are keyed by method and the path
  below the API root, query string excluded. Unrouted requests get 404.
*/
class FakeTransport final : public remote::HttpTransport {
 public:
  using Handler = std::function<remote::HttpResponse(const remote::HttpRequest&)>;

  void On(remote::HttpMethod method, const std::string& path, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[{method, path}] = std::move(handler);
  }

  void Respond(remote::HttpMethod method, const std::string& path, int status, std::string body) {
    On(method, path, [status, body](const remote::HttpRequest&) { return remote::HttpResponse{status, body}; });
  }

  void Unreachable(remote::HttpMethod method, const std::string& path) {
    On(method, path, [](const remote::HttpRequest&) -> remote::HttpResponse {
      throw remote::TransportError("connection refused", false);
    });
  }

  remote::HttpResponse Send(const remote::HttpRequest& request) override {
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      auto it = routes_.find({request.method, PathOf(request.url)});
      if (it != routes_.end()) handler = it->second;
    }
    if (!handler) return {404, R"({"message":"no route"})"};
    return handler(request);
  }

  std::vector<remote::HttpRequest> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::size_t Count(remote::HttpMethod method, const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 n = 0;
    for (const auto& r : requests_) {
      if (r.method == method && PathOf(r.url) == path) ++n;
    }
    return n;
  }

  std::size_t Total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

  static std::string PathOf(const std::string& url) {
    const std::string root = kApiRoot;
    std::string       path = url.rfind(root, 0) == 0 ? url.substr(root.size()) : url;
    auto              q    = path.find('?');
    return q == std::string::npos ? path : path.substr(0, q);
  }

 private:
  mutable std::mutex                                                   mutex_;
  std::map<std::pair<remote::HttpMethod, std::string>, Handler>        routes_;
  std::vector<remote::HttpRequest>                                     requests_;
};

class FakeAuth final : public net::AuthProvider {
 public:
  bool IsAuthenticated() override {
    return authenticated_.load();
  }

  std::string BearerToken() override {
    return authenticated_.load() ? "test-token" : "";
  }

  void SetAuthenticated(bool value) {
    authenticated_.store(value);
  }

 private:
  std::atomic<bool> authenticated_{true};
};

// Fresh store at the current schema version.
inline std::shared_ptr<db::sqlite::SqliteRepository> MakeRepository(const std::string& path = ":memory:") {
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
  db::sqlite::MigrateSchema(*sqlite_db);
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

inline std::shared_ptr<remote::PurchaseApi> MakeApi(std::shared_ptr<FakeTransport> transport, std::shared_ptr<net::AuthProvider> auth) {
  remote::ApiSettings settings;
  settings.base_url = kBaseUrl;
  return std::make_shared<remote::PurchaseApi>(settings, std::move(transport), std::move(auth));
}

inline db::model::PurchaseHeaderRecord MakeHeader(std::int64_t supplier_id, const std::string& ref_no, double total = 100.0) {
  db::model::PurchaseHeaderRecord h;
  h.supplier_id      = supplier_id;
  h.location_id      = 1;
  h.ref_no           = ref_no;
  h.status           = db::model::PurchaseStatus::kOrdered;
  h.transaction_date = "2024-03-01T10:15:30.000Z";
  h.total_before_tax = total;
  h.final_total      = total;
  return h;
}

inline db::model::PurchaseLineRecord MakeLine(std::int64_t product_id, double quantity, double unit_price) {
  db::model::PurchaseLineRecord l;
  l.product_id   = product_id;
  l.variation_id = product_id * 10;
  l.quantity     = quantity;
  l.unit_price   = unit_price;
  return l;
}

} // namespace purchase::testing
