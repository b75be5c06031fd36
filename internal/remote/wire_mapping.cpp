#include "wire_mapping.hpp"

#include <initializer_list>
#include <string>

#include "internal/remote/json.hpp"

namespace purchase::remote {

namespace {

// first non-empty string among keys
std::string FirstString(const google::protobuf::Value& v, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (auto s = json::AsString(json::Field(v, key)); s && !s->empty()) return *s;
  }
  return {};
}

std::optional<std::int64_t> FirstInt(const google::protobuf::Value& v, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (auto i = json::AsInt64(json::Field(v, key))) return i;
  }
  return std::nullopt;
}

} // namespace

std::optional<RemotePurchase> RemotePurchaseFromJson(const google::protobuf::Value& v) {
  auto id = json::AsInt64(json::Field(v, "id"));
  if (!id || *id <= 0) return std::nullopt;

  RemotePurchase p;
  p.remote_id   = *id;
  p.supplier_id = FirstInt(v, {"contact_id", "supplier_id"}).value_or(0);
  p.location_id = json::Int64Or(v, "location_id", 0);
  if (auto ref = json::AsString(json::Field(v, "ref_no")); ref && !ref->empty()) p.ref_no = *ref;
  p.status           = json::StringOr(v, "status");
  p.payment_status   = json::StringOr(v, "payment_status");
  p.transaction_date = json::StringOr(v, "transaction_date");
  p.final_total      = json::DoubleOr(v, "final_total", 0.0);

  p.supplier_name = FirstString(v, {"supplier_name", "contact_name", "name"});
  if (p.supplier_name.empty()) {
    if (const auto* contact = json::Field(v, "contact"); json::IsObject(contact)) {
      p.supplier_name = FirstString(*contact, {"name", "supplier_business_name"});
    }
  }
  return p;
}

std::optional<db::model::SupplierRecord> SupplierFromJson(const google::protobuf::Value& v) {
  auto id = json::AsInt64(json::Field(v, "id"));
  if (!id) return std::nullopt;

  db::model::SupplierRecord s;
  s.id              = *id;
  s.name            = FirstString(v, {"name", "text", "supplier_business_name"});
  s.business_name   = FirstString(v, {"supplier_business_name", "business_name"});
  s.mobile          = json::StringOr(v, "mobile");
  s.address_line_1  = json::StringOr(v, "address_line_1");
  s.city            = json::StringOr(v, "city");
  s.state           = json::StringOr(v, "state");
  s.country         = json::StringOr(v, "country");
  s.zip_code        = json::StringOr(v, "zip_code");
  s.contact_code    = json::StringOr(v, "contact_id");
  s.pay_term_type   = json::StringOr(v, "pay_term_type");
  s.pay_term_number = json::Int64Or(v, "pay_term_number", 0);
  s.balance         = json::DoubleOr(v, "balance", 0.0);
  return s;
}

std::optional<db::model::ProductRecord> ProductFromJson(const google::protobuf::Value& v) {
  auto id = FirstInt(v, {"product_id", "id"});
  if (!id) return std::nullopt;

  db::model::ProductRecord p;
  p.product_id             = *id;
  p.product_name           = FirstString(v, {"product_name", "name", "text"});
  p.product_type           = FirstString(v, {"product_type", "type"});
  p.variation_id           = FirstInt(v, {"variation_id"}).value_or(0);
  p.variation_name         = json::StringOr(v, "variation_name");
  p.sub_sku                = FirstString(v, {"sub_sku", "sku"});
  p.default_purchase_price = json::AsDouble(json::Field(v, "default_purchase_price"))
                                 .value_or(json::DoubleOr(v, "purchase_price", 0.0));
  return p;
}

std::optional<db::model::LocationRecord> LocationFromJson(const google::protobuf::Value& v) {
  auto id = json::AsInt64(json::Field(v, "id"));
  if (!id) return std::nullopt;

  db::model::LocationRecord l;
  l.id            = *id;
  l.name          = json::StringOr(v, "name");
  l.location_code = FirstString(v, {"location_id"});
  if (l.location_code.empty()) l.location_code = std::to_string(*id);
  l.address  = FirstString(v, {"address", "landmark"});
  l.city     = json::StringOr(v, "city");
  l.state    = json::StringOr(v, "state");
  l.country  = json::StringOr(v, "country");
  l.zip_code = json::StringOr(v, "zip_code");
  return l;
}

db::model::PurchasePaymentRecord PaymentFromJson(const google::protobuf::Value& v, std::int64_t purchase_id) {
  db::model::PurchasePaymentRecord p;
  p.purchase_id       = purchase_id;
  p.remote_payment_id = json::AsInt64(json::Field(v, "id"));
  p.method            = json::StringOr(v, "method", "cash");
  p.amount            = json::DoubleOr(v, "amount", 0.0);
  p.note              = json::StringOr(v, "note");
  p.account_id        = json::AsInt64(json::Field(v, "account_id"));
  p.paid_on           = json::StringOr(v, "paid_on");
  return p;
}

} // namespace purchase::remote
