#include "purchase_api.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/remote/json.hpp"
#include "internal/remote/remote_error.hpp"
#include "internal/remote/response_shapes.hpp"
#include "internal/remote/wire_mapping.hpp"

namespace purchase::remote {

namespace {

using Clock = std::chrono::steady_clock;

// "/purchase/12,13/status" -> "/purchase/{id}/status"
std::string RouteLabel(const std::string& route) {
  std::string out;
  std::size_t i = 0;
  while (i < route.size()) {
    if (route[i] != '/') {
      out.push_back(route[i++]);
      continue;
    }
    out.push_back('/');
    std::size_t end = route.find('/', i + 1);
    if (end == std::string::npos) end = route.size();
    const std::string segment = route.substr(i + 1, end - i - 1);
    const bool numeric = !segment.empty() && segment.find_first_not_of("0123456789,") == std::string::npos;
    out += numeric ? "{id}" : segment;
    i = end;
  }
  return out;
}

std::string JoinIds(const std::vector<std::int64_t>& ids) {
  std::string out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i) out.push_back(',');
    out += std::to_string(ids[i]);
  }
  return out;
}

template <typename Record, typename Mapper>
std::vector<Record> MapList(const google::protobuf::Value& response, const char* what, Mapper map) {
  auto items = ExtractList(response);
  if (!items) {
    throw RemoteError(FailureKind::kMalformed, 200, std::string("unexpected ") + what + " response shape");
  }
  std::vector<Record> out;
  out.reserve(items->size());
  for (const auto* item : *items) {
    if (!json::IsObject(item)) continue;
    if (auto rec = map(*item)) out.push_back(std::move(*rec));
  }
  return out;
}

} // namespace

std::string UrlEncode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

PurchaseApi::PurchaseApi(ApiSettings settings, std::shared_ptr<HttpTransport> transport,
                         std::shared_ptr<net::AuthProvider> auth)
    : settings_(std::move(settings)), transport_(std::move(transport)), auth_(std::move(auth)) {
  if (!transport_) throw std::invalid_argument("PurchaseApi requires a transport");
  if (!auth_) throw std::invalid_argument("PurchaseApi requires an auth provider");

  while (!settings_.base_url.empty() && settings_.base_url.back() == '/') settings_.base_url.pop_back();
  if (settings_.per_page == 0) settings_.per_page = 20;
}

std::string PurchaseApi::Url(const std::string& route, const Query& query) const {
  std::string url = settings_.base_url + settings_.api_prefix + route;
  char        sep = '?';
  for (const auto& [key, value] : query) {
    url.push_back(sep);
    url += UrlEncode(key);
    url.push_back('=');
    url += UrlEncode(value);
    sep = '&';
  }
  return url;
}

google::protobuf::Value PurchaseApi::Call(HttpMethod method, const std::string& route, const Query& query,
                                          const std::string* body) {
  HttpRequest request;
  request.method          = method;
  request.url             = Url(route, query);
  request.connect_timeout = settings_.connect_timeout;
  request.timeout         = settings_.request_timeout;
  request.headers         = {
      {"Authorization", "Bearer " + auth_->BearerToken()},
      {"Content-Type", "application/json"},
      {"Accept", "application/json"},
  };
  if (body) request.body = *body;

  const std::string label = std::string(ToString(method)) + " " + RouteLabel(route);
  const auto        start = Clock::now();

  HttpResponse response;
  try {
    response = transport_->Send(request);
  } catch (const TransportError& e) {
    PURCHASE_LOG_WARN("remote call failed", {observability::StringField("route", label),
                                             observability::BoolField("timed_out", e.TimedOut()),
                                             observability::StringField("error", e.what())});
    throw RemoteError(FailureKind::kNetwork, 0, e.TimedOut() ? std::string("request timed out") : e.what());
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
  observability::Metrics::Instance().ObserveRemoteLatencyMs(label, elapsed);

  if (response.status < 200 || response.status >= 300) {
    auto error = ClassifyHttpFailure(response.status, response.body);
    PURCHASE_LOG_WARN("remote call rejected", {observability::StringField("route", label),
                                               observability::IntField("status", response.status),
                                               observability::StringField("kind", ToString(error.Kind())),
                                               observability::StringField("error", error.what())});
    throw error;
  }

  google::protobuf::Value value;
  if (response.body.empty()) return json::Null();
  if (!json::Parse(response.body, &value)) {
    PURCHASE_LOG_WARN("remote response is not JSON", {observability::StringField("route", label),
                                                      observability::IntField("status", response.status)});
    throw RemoteError(FailureKind::kMalformed, response.status, "response body is not valid JSON");
  }
  return value;
}

google::protobuf::Value PurchaseApi::CreatePurchase(const google::protobuf::Struct& payload) {
  const std::string body = json::Serialize(payload);
  return Call(HttpMethod::kPost, "/purchase", {}, &body);
}

google::protobuf::Value PurchaseApi::UpdatePurchase(std::int64_t remote_id, const google::protobuf::Struct& payload) {
  const std::string body = json::Serialize(payload);
  return Call(HttpMethod::kPut, "/purchase/" + std::to_string(remote_id), {}, &body);
}

google::protobuf::Value PurchaseApi::GetPurchase(std::int64_t remote_id) {
  auto response = Call(HttpMethod::kGet, "/purchase/" + std::to_string(remote_id));

  const auto* record = ExtractRecord(response);
  if (json::IsList(record) && record->list_value().values_size() > 0) {
    return record->list_value().values(0);
  }
  if (!json::IsObject(record)) {
    throw RemoteError(FailureKind::kMalformed, 200, "purchase " + std::to_string(remote_id) + " response has no record");
  }
  return *record;
}

std::vector<RemotePurchase> PurchaseApi::GetPurchases(const std::vector<std::int64_t>& remote_ids) {
  if (remote_ids.empty()) return {};
  auto response = Call(HttpMethod::kGet, "/purchase/" + JoinIds(remote_ids));

  // a single id may come back as the bare record
  if (auto items = ExtractList(response); !items) {
    const auto* record = ExtractRecord(response);
    if (!json::IsObject(record)) {
      throw RemoteError(FailureKind::kMalformed, 200, "unexpected purchase lookup response shape");
    }
    std::vector<RemotePurchase> out;
    if (auto p = RemotePurchaseFromJson(*record)) out.push_back(std::move(*p));
    return out;
  }
  return MapList<RemotePurchase>(response, "purchase lookup", &RemotePurchaseFromJson);
}

PurchasePage PurchaseApi::ListPurchases(const PurchaseListFilter& filter) {
  Query query;
  if (filter.supplier_id) query.emplace_back("supplier_id", std::to_string(*filter.supplier_id));
  if (filter.location_id) query.emplace_back("location_id", std::to_string(*filter.location_id));
  if (filter.status) query.emplace_back("status", *filter.status);
  if (filter.payment_status) query.emplace_back("payment_status", *filter.payment_status);
  if (filter.start_date) query.emplace_back("start_date", *filter.start_date);
  if (filter.end_date) query.emplace_back("end_date", *filter.end_date);
  if (filter.ref_no) query.emplace_back("ref_no", *filter.ref_no);
  query.emplace_back("page", std::to_string(filter.page > 0 ? filter.page : 1));
  query.emplace_back("per_page", std::to_string(filter.per_page > 0 ? filter.per_page : settings_.per_page));

  auto response = Call(HttpMethod::kGet, "/purchase", query);

  auto envelope = ExtractPage(response);
  if (!envelope) {
    throw RemoteError(FailureKind::kMalformed, 200, "unexpected purchase list response shape");
  }

  PurchasePage page;
  page.current_page = envelope->current_page;
  page.last_page    = envelope->last_page;
  page.per_page     = envelope->per_page;
  page.total        = envelope->total;
  page.items.reserve(envelope->items.size());
  for (const auto* item : envelope->items) {
    if (!json::IsObject(item)) continue;
    if (auto p = RemotePurchaseFromJson(*item)) page.items.push_back(std::move(*p));
  }
  return page;
}

void PurchaseApi::DeletePurchase(std::int64_t remote_id) {
  auto response = Call(HttpMethod::kDelete, "/purchase/" + std::to_string(remote_id));

  if (auto ok = json::AsBool(json::Field(response, "success")); ok && !*ok) {
    auto msg = ExtractMessage(response);
    throw RemoteError(FailureKind::kRejected, 200, msg.empty() ? "delete refused by remote" : msg);
  }
}

void PurchaseApi::UpdateStatus(std::int64_t remote_id, const std::string& status) {
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["status"] = json::Text(status);
  const std::string body = json::Serialize(payload);

  auto response = Call(HttpMethod::kPost, "/purchase/" + std::to_string(remote_id) + "/status", {}, &body);

  if (auto ok = json::AsBool(json::Field(response, "success")); ok && !*ok) {
    auto msg = ExtractMessage(response);
    throw RemoteError(FailureKind::kRejected, 200, msg.empty() ? "status change refused by remote" : msg);
  }
}

bool PurchaseApi::CheckReferenceNumber(std::int64_t supplier_id, const std::string& ref_no) {
  auto response = Call(HttpMethod::kGet, "/purchase/check-ref",
                       {{"contact_id", std::to_string(supplier_id)}, {"ref_no", ref_no}});

  for (const char* path : {"exists", "data.exists"}) {
    if (auto exists = json::AsBool(json::Path(response, path))) return *exists;
  }
  // older servers answer "true"/"false" as the bare body
  if (auto exists = json::AsBool(&response)) return *exists;
  throw RemoteError(FailureKind::kMalformed, 200, "check-ref response has no \"exists\" flag");
}

std::vector<db::model::SupplierRecord> PurchaseApi::GetSuppliers(const std::string& term) {
  auto response = Call(HttpMethod::kGet, "/purchase/suppliers", {{"term", term}});
  return MapList<db::model::SupplierRecord>(response, "supplier list", &SupplierFromJson);
}

std::vector<db::model::ProductRecord> PurchaseApi::GetProducts(const std::string& term) {
  auto response = Call(HttpMethod::kGet, "/purchase/products", {{"term", term}});
  return MapList<db::model::ProductRecord>(response, "product list", &ProductFromJson);
}

std::vector<db::model::LocationRecord> PurchaseApi::GetLocations() {
  auto response = Call(HttpMethod::kGet, "/business-location");
  return MapList<db::model::LocationRecord>(response, "location list", &LocationFromJson);
}

} // namespace purchase::remote
