#include "internal/remote/remote_error.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace purchase::remote;

void TestUnauthorizedUsesLoginMessage() {
  auto err = ClassifyHttpFailure(401, R"({"message":"Unauthenticated."})");
  assert(err.Kind() == FailureKind::kAuthentication);
  assert(err.Status() == 401);
  assert(std::string(err.what()) == "Authentication failed. Please login again.");
}

void TestValidationCarriesFieldErrors() {
  auto err = ClassifyHttpFailure(422, R"({"message":"The given data was invalid.","errors":{"ref_no":["taken"],"contact_id":"required"}})");
  assert(err.Kind() == FailureKind::kValidation);
  assert(err.Fields().size() == 2);
  assert(err.Fields().at("ref_no").front() == "taken");
  assert(err.Fields().at("contact_id").front() == "required");
  assert(std::string(err.what()) == "contact_id: required; ref_no: taken");

  auto bare = ClassifyHttpFailure(422, R"({"message":"Bad total"})");
  assert(bare.Fields().empty());
  assert(std::string(bare.what()) == "Bad total");
}

void TestStatusClassification() {
  assert(ClassifyHttpFailure(408, "").Kind() == FailureKind::kNetwork);
  assert(ClassifyHttpFailure(500, "<html>").Kind() == FailureKind::kServer);
  assert(ClassifyHttpFailure(503, "").Kind() == FailureKind::kServer);
  assert(ClassifyHttpFailure(403, "").Kind() == FailureKind::kRejected);

  auto missing = ClassifyHttpFailure(404, "");
  assert(missing.Kind() == FailureKind::kRejected);
  assert(std::string(missing.what()) == "Resource not found");
}

void TestMessageLookupOrder() {
  google::protobuf::Value body;
  body.mutable_struct_value();
  assert(ExtractMessage(body).empty());

  auto nested = ClassifyHttpFailure(400, R"({"error":{"message":"bad supplier"}})");
  assert(std::string(nested.what()) == "bad supplier");

  auto flat = ClassifyHttpFailure(409, R"({"msg":"duplicate"})");
  assert(std::string(flat.what()) == "duplicate");
}

void TestKindNames() {
  assert(std::string(ToString(FailureKind::kAuthentication)) == "auth");
  assert(std::string(ToString(FailureKind::kMalformed)) == "malformed");
}

} // namespace

int main() {
  TestUnauthorizedUsesLoginMessage();
  TestValidationCarriesFieldErrors();
  TestStatusClassification();
  TestMessageLookupOrder();
  TestKindNames();

  std::cout << "purchase_sync_unit_remote_error: pass\n";
  return 0;
}
