#include "draft_json.hpp"

#include <initializer_list>
#include <optional>

#include "internal/remote/json.hpp"
#include "internal/sync/payload_builder.hpp"
#include "internal/util/errors.hpp"

namespace purchase::core {

namespace json = purchase::remote::json;

namespace {

std::optional<std::int64_t> OptionalId(const google::protobuf::Value& v, const char* key) {
  auto id = json::AsInt64(json::Field(v, key));
  if (id && *id == 0) return std::nullopt;
  return id;
}

db::model::DiscountType DiscountOr(const google::protobuf::Value& v, const char* key) {
  const auto text = json::StringOr(v, key, "fixed");
  auto       type = db::model::ParseDiscountType(text);
  if (!type) throw util::InvalidArgument("unknown discount type: " + text);
  return *type;
}

db::model::PurchaseLineRecord LineFromJson(const google::protobuf::Value& v) {
  db::model::PurchaseLineRecord line;
  line.product_id                   = json::Int64Or(v, "product_id", 0);
  line.variation_id                 = json::Int64Or(v, "variation_id", 0);
  line.quantity                     = json::DoubleOr(v, "quantity", 0.0);
  line.unit_price                   = json::DoubleOr(v, "unit_price", json::DoubleOr(v, "pp_without_discount", 0.0));
  line.line_discount_amount         = json::DoubleOr(v, "line_discount_amount", 0.0);
  line.line_discount_type           = DiscountOr(v, "line_discount_type");
  line.item_tax_id                  = OptionalId(v, "item_tax_id");
  line.item_tax                     = json::DoubleOr(v, "item_tax", 0.0);
  line.sub_unit_id                  = OptionalId(v, "sub_unit_id");
  line.lot_number                   = json::StringOr(v, "lot_number");
  line.mfg_date                     = json::StringOr(v, "mfg_date");
  line.exp_date                     = json::StringOr(v, "exp_date");
  line.purchase_order_line_id       = OptionalId(v, "purchase_order_line_id");
  line.purchase_requisition_line_id = OptionalId(v, "purchase_requisition_line_id");
  if (line.product_id <= 0) throw util::InvalidArgument("purchase line: product_id is required");
  return line;
}

db::model::PurchasePaymentRecord PaymentFromJson(const google::protobuf::Value& v) {
  db::model::PurchasePaymentRecord p;
  p.method     = json::StringOr(v, "method", "cash");
  p.amount     = json::DoubleOr(v, "amount", 0.0);
  p.note       = json::StringOr(v, "note");
  p.account_id = OptionalId(v, "account_id");
  p.paid_on    = json::StringOr(v, "paid_on");
  return p;
}

const google::protobuf::Value* FirstList(const google::protobuf::Value& v, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (const auto* list = json::Field(v, key); json::IsList(list)) return list;
  }
  return nullptr;
}

} // namespace

PurchaseDraft DraftFromJson(const google::protobuf::Value& v) {
  if (!json::IsObject(&v)) throw util::InvalidArgument("purchase draft must be a JSON object");

  PurchaseDraft draft;
  auto&         h = draft.header;
  h.supplier_id   = json::AsInt64(json::Field(v, "contact_id")).value_or(json::Int64Or(v, "supplier_id", 0));
  h.location_id   = json::Int64Or(v, "location_id", 0);
  if (auto ref = json::AsString(json::Field(v, "ref_no")); ref && !ref->empty()) h.ref_no = *ref;

  const auto status_text = json::StringOr(v, "status", "ordered");
  auto       status      = db::model::ParsePurchaseStatus(status_text);
  if (!status) throw util::InvalidArgument("unknown purchase status: " + status_text);
  h.status = *status;

  h.transaction_date = json::StringOr(v, "transaction_date");
  h.total_before_tax = json::DoubleOr(v, "total_before_tax", 0.0);
  h.discount_type    = DiscountOr(v, "discount_type");
  h.discount_amount  = json::DoubleOr(v, "discount_amount", 0.0);
  h.tax_id           = OptionalId(v, "tax_id");
  h.tax_amount       = json::DoubleOr(v, "tax_amount", 0.0);
  h.shipping_charges = json::DoubleOr(v, "shipping_charges", 0.0);
  h.shipping_details = json::StringOr(v, "shipping_details");
  h.final_total      = json::DoubleOr(v, "final_total", 0.0);
  h.additional_notes = json::StringOr(v, "additional_notes");

  if (const auto* lines = FirstList(v, {"purchases", "lines"})) {
    for (const auto& item : lines->list_value().values()) draft.lines.push_back(LineFromJson(item));
  }
  if (const auto* payments = FirstList(v, {"payments", "payment_lines"})) {
    for (const auto& item : payments->list_value().values()) draft.payments.push_back(PaymentFromJson(item));
  }
  return draft;
}

PurchaseDraft DraftFromJson(const std::string& text) {
  google::protobuf::Value value;
  if (!json::Parse(text, &value)) throw util::InvalidArgument("purchase draft is not valid JSON");
  return DraftFromJson(value);
}

std::string DetailToJson(const PurchaseDetail& detail) {
  auto body    = sync::PayloadBuilder::Build(detail.header, detail.lines, detail.payments);
  auto& fields = *body.mutable_fields();

  fields["local_id"]  = json::Number(static_cast<double>(detail.header.local_id));
  fields["remote_id"] = detail.header.remote_id ? json::Number(static_cast<double>(*detail.header.remote_id)) : json::Null();
  fields["synced"]    = json::Bool(detail.header.sync_state == db::model::SyncState::kSynced);
  fields["transaction_date"] = json::Text(detail.header.transaction_date);
  return json::Serialize(body);
}

} // namespace purchase::core
