#include "internal/remote/purchase_api.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/remote/json.hpp"
#include "internal/remote/remote_error.hpp"
#include "tests/support/fakes.hpp"

namespace {

using namespace purchase;
using remote::FailureKind;
using remote::HttpMethod;
using testing::FakeAuth;
using testing::FakeTransport;

bool HasHeader(const remote::HttpRequest& r, const std::string& name, const std::string& value) {
  for (const auto& [k, v] : r.headers) {
    if (k == name && v == value) return true;
  }
  return false;
}

template <typename Fn>
remote::RemoteError ExpectRemoteError(Fn fn) {
  try {
    fn();
  } catch (const remote::RemoteError& e) {
    return e;
  }
  assert(false && "expected RemoteError");
  return remote::RemoteError(FailureKind::kMalformed, 0, "unreachable");
}

void TestRequestsCarryBearerAndJsonHeaders() {
  auto transport = std::make_shared<FakeTransport>();
  auto api       = testing::MakeApi(transport, std::make_shared<FakeAuth>());
  transport->Respond(HttpMethod::kPost, "/purchase", 200, R"({"id": 555})");

  google::protobuf::Struct payload;
  (*payload.mutable_fields())["contact_id"] = remote::json::Number(7);
  auto response = api->CreatePurchase(payload);
  assert(remote::json::Int64Or(response, "id", 0) == 555);

  const auto requests = transport->Requests();
  assert(requests.size() == 1);
  assert(requests[0].url == std::string(testing::kApiRoot) + "/purchase");
  assert(HasHeader(requests[0], "Authorization", "Bearer test-token"));
  assert(HasHeader(requests[0], "Content-Type", "application/json"));
  assert(HasHeader(requests[0], "Accept", "application/json"));
  assert(requests[0].body.find("\"contact_id\"") != std::string::npos);
}

void TestTrailingSlashInBaseUrlIsIgnored() {
  auto transport = std::make_shared<FakeTransport>();
  remote::ApiSettings settings;
  settings.base_url = std::string(testing::kBaseUrl) + "//";
  remote::PurchaseApi api(settings, transport, std::make_shared<FakeAuth>());
  transport->Respond(HttpMethod::kGet, "/business-location", 200, R"([{"id": 1, "name": "Main"}])");

  auto locations = api.GetLocations();
  assert(locations.size() == 1);
  assert(transport->Requests()[0].url == std::string(testing::kApiRoot) + "/business-location");
}

void TestListQueryEncodingAndNestedPage() {
  auto transport = std::make_shared<FakeTransport>();
  auto api       = testing::MakeApi(transport, std::make_shared<FakeAuth>());
  transport->Respond(HttpMethod::kGet, "/purchase", 200,
                     R"({"data": {"data": [{"id": 1, "contact_id": 7}, {"id": 2, "contact_id": 7}],
                         "current_page": 2, "last_page": 3, "per_page": 2, "total": 6}})");

  remote::PurchaseListFilter filter;
  filter.supplier_id = 7;
  filter.ref_no      = "PO 1&2";
  filter.page        = 2;
  auto page = api->ListPurchases(filter);

  assert(page.items.size() == 2);
  assert(page.current_page == 2 && page.last_page == 3 && page.total == 6);

  const auto url = transport->Requests()[0].url;
  assert(url.find("supplier_id=7") != std::string::npos);
  assert(url.find("ref_no=PO%201%262") != std::string::npos);
  assert(url.find("page=2") != std::string::npos);
  assert(url.find("per_page=20") != std::string::npos);
}

void TestValidationFailureSurfacesFieldErrors() {
  auto transport = std::make_shared<FakeTransport>();
  auto api       = testing::MakeApi(transport, std::make_shared<FakeAuth>());
  transport->Respond(HttpMethod::kPut, "/purchase/9", 422, R"({"errors": {"final_total": ["must be positive"]}})");

  auto err = ExpectRemoteError([&] { api->UpdatePurchase(9, {}); });
  assert(err.Kind() == FailureKind::kValidation);
  assert(err.Status() == 422);
  assert(err.Fields().count("final_total") == 1);
}

void TestTransportFailureIsNetwork() {
  auto transport = std::make_shared<FakeTransport>();
  auto api       = testing::MakeApi(transport, std::make_shared<FakeAuth>());
  transport->Unreachable(HttpMethod::kGet, "/purchase/suppliers");

  auto err = ExpectRemoteError([&] { api->GetSuppliers(); });
  assert(err.Kind() == FailureKind::kNetwork);
  assert(err.Status() == 0);
}

void TestMalformedBodies() {
  auto transport = std::make_shared<FakeTransport>();
  auto api       = testing::MakeApi(transport, std::make_shared<FakeAuth>());
  transport->Respond(HttpMethod::kGet, "/purchase/products", 200, "<html>oops</html>");
  transport->Respond(HttpMethod::kGet, "/purchase/suppliers", 200, R"({"id": 1})");

  assert(ExpectRemoteError([&] { api->GetProducts(); }).Kind() == FailureKind::kMalformed);
  assert(ExpectRemoteError([&] { api->GetSuppliers(); }).Kind() == FailureKind::kMalformed);
}

void TestLookupByIdsAndSingleRecordShape() {
  auto transport = std::make_shared<FakeTransport>();
  auto api       = testing::MakeApi(transport, std::make_shared<FakeAuth>());
  transport->Respond(HttpMethod::kGet, "/purchase/1,2,3", 200, R"({"data": [{"id": 1}, {"id": 3}]})");
  transport->Respond(HttpMethod::kGet, "/purchase/4", 200, R"({"data": {"id": 4, "ref_no": "PO-4"}})");

  auto found = api->GetPurchases({1, 2, 3});
  assert(found.size() == 2);
  assert(found[0].remote_id == 1 && found[1].remote_id == 3);

  auto single = api->GetPurchases({4});
  assert(single.size() == 1 && single[0].ref_no == "PO-4");

  assert(api->GetPurchases({}).empty());
}

void TestReferenceCheckShapes() {
  auto transport = std::make_shared<FakeTransport>();
  auto api       = testing::MakeApi(transport, std::make_shared<FakeAuth>());

  transport->Respond(HttpMethod::kGet, "/purchase/check-ref", 200, R"({"exists": true})");
  assert(api->CheckReferenceNumber(7, "PO-1"));

  transport->Respond(HttpMethod::kGet, "/purchase/check-ref", 200, R"({"data": {"exists": false}})");
  assert(!api->CheckReferenceNumber(7, "PO-1"));

  transport->Respond(HttpMethod::kGet, "/purchase/check-ref", 200, "true");
  assert(api->CheckReferenceNumber(7, "PO-1"));

  const auto url = transport->Requests().back().url;
  assert(url.find("contact_id=7") != std::string::npos);
  assert(url.find("ref_no=PO-1") != std::string::npos);
}

void TestStatusAndDeleteRefusals() {
  auto transport = std::make_shared<FakeTransport>();
  auto api       = testing::MakeApi(transport, std::make_shared<FakeAuth>());
  transport->Respond(HttpMethod::kPost, "/purchase/5/status", 200, R"({"success": true})");
  transport->Respond(HttpMethod::kDelete, "/purchase/5", 200, R"({"success": false, "msg": "has payments"})");

  api->UpdateStatus(5, "received");
  assert(transport->Requests().back().body.find("received") != std::string::npos);

  auto err = ExpectRemoteError([&] { api->DeletePurchase(5); });
  assert(err.Kind() == FailureKind::kRejected);
  assert(std::string(err.what()) == "has payments");
}

void TestUrlEncode() {
  assert(remote::UrlEncode("a b/c") == "a%20b%2Fc");
  assert(remote::UrlEncode("Safe-_.~") == "Safe-_.~");
}

} // namespace

int main() {
  TestRequestsCarryBearerAndJsonHeaders();
  TestTrailingSlashInBaseUrlIsIgnored();
  TestListQueryEncodingAndNestedPage();
  TestValidationFailureSurfacesFieldErrors();
  TestTransportFailureIsNetwork();
  TestMalformedBodies();
  TestLookupByIdsAndSingleRecordShape();
  TestReferenceCheckShapes();
  TestStatusAndDeleteRefusals();
  TestUrlEncode();

  std::cout << "purchase_sync_unit_purchase_api: pass\n";
  return 0;
}
