#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/reference_records.hpp"
#include "internal/net/probes.hpp"
#include "internal/remote/http_transport.hpp"
#include "internal/remote/remote_purchase.hpp"

namespace purchase::remote {

struct ApiSettings {
  std::string               base_url;
  std::string               api_prefix = "/connector/api";
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds request_timeout{30000};
  std::uint32_t             per_page = 20;
};

struct PurchaseListFilter {
  std::optional<std::int64_t> supplier_id;
  std::optional<std::int64_t> location_id;
  std::optional<std::string>  status;
  std::optional<std::string>  payment_status;
  std::optional<std::string>  start_date;
  std::optional<std::string>  end_date;
  std::optional<std::string>  ref_no;

  std::int64_t page     = 1;
  std::int64_t per_page = 0; // 0: ApiSettings::per_page
};

/*
  Remote purchase endpoints.

  Every method either returns the decoded response or throws RemoteError;
  transport failures surface as FailureKind::kNetwork with status 0.
  Stateless apart from its collaborators; safe to share across threads.
*/
class PurchaseApi {
 public:
  PurchaseApi(ApiSettings settings, std::shared_ptr<HttpTransport> transport, std::shared_ptr<net::AuthProvider> auth);

  // POST /purchase; raw response for identifier and payment extraction
  google::protobuf::Value CreatePurchase(const google::protobuf::Struct& payload);

  // PUT /purchase/{id}
  google::protobuf::Value UpdatePurchase(std::int64_t remote_id, const google::protobuf::Struct& payload);

  // GET /purchase/{id}; the record object
  google::protobuf::Value GetPurchase(std::int64_t remote_id);

  // GET /purchase/{a,b,...}; ids the remote no longer knows are simply absent
  std::vector<RemotePurchase> GetPurchases(const std::vector<std::int64_t>& remote_ids);

  PurchasePage ListPurchases(const PurchaseListFilter& filter);

  // DELETE /purchase/{id}
  void DeletePurchase(std::int64_t remote_id);

  // POST /purchase/{id}/status
  void UpdateStatus(std::int64_t remote_id, const std::string& status);

  // GET /purchase/check-ref; true when the reference is already taken
  bool CheckReferenceNumber(std::int64_t supplier_id, const std::string& ref_no);

  std::vector<db::model::SupplierRecord> GetSuppliers(const std::string& term = {});
  std::vector<db::model::ProductRecord>  GetProducts(const std::string& term = {});
  std::vector<db::model::LocationRecord> GetLocations();

  const ApiSettings& Settings() const {
    return settings_;
  }

 private:
  using Query = std::vector<std::pair<std::string, std::string>>;

  google::protobuf::Value Call(HttpMethod method, const std::string& route, const Query& query = {},
                               const std::string* body = nullptr);

  std::string Url(const std::string& route, const Query& query) const;

  ApiSettings                        settings_;
  std::shared_ptr<HttpTransport>     transport_;
  std::shared_ptr<net::AuthProvider> auth_;
};

std::string UrlEncode(const std::string& text);

} // namespace purchase::remote
