#include "payload_builder.hpp"

#include <optional>
#include <string>

#include "internal/remote/json.hpp"
#include "internal/util/time.hpp"

namespace purchase::sync {

namespace json = purchase::remote::json;

namespace {

google::protobuf::Value OptionalId(const std::optional<std::int64_t>& id) {
  if (!id || *id == 0) return json::Null();
  return json::Number(static_cast<double>(*id));
}

google::protobuf::Value OptionalText(const std::string& text) {
  return text.empty() ? json::Null() : json::Text(text);
}

// stored ISO-8601 -> "YYYY-MM-DD HH:MM:SS"; unparsable text goes through unchanged
std::string WireDate(const std::string& stored) {
  if (auto tp = util::ParseIso8601(stored)) return util::FormatWireDateTime(*tp);
  return stored;
}

} // namespace

google::protobuf::Value PayloadBuilder::Line(const db::model::PurchaseLineRecord& line) {
  google::protobuf::Value out;
  auto&                   f = *out.mutable_struct_value()->mutable_fields();

  const bool   fixed_discount = line.line_discount_type == db::model::DiscountType::kFixed && line.line_discount_amount > 0;
  const double net_price      = fixed_discount ? line.unit_price - line.line_discount_amount : line.unit_price;

  f["product_id"]             = json::Number(static_cast<double>(line.product_id));
  f["variation_id"]           = json::Number(static_cast<double>(line.variation_id));
  f["quantity"]               = json::Number(line.quantity);
  f["unit_price"]             = json::Number(line.unit_price);
  f["pp_without_discount"]    = json::Number(line.unit_price);
  f["purchase_price"]         = json::Number(net_price);
  f["purchase_price_inc_tax"] = json::Number(net_price);
  f["discount_percent"] =
      json::Number(line.line_discount_type == db::model::DiscountType::kPercentage ? line.line_discount_amount : 0.0);
  f["line_discount_amount"]         = json::Number(line.line_discount_amount);
  f["line_discount_type"]           = json::Text(db::model::ToString(line.line_discount_type));
  f["purchase_line_tax_id"]         = OptionalId(line.item_tax_id);
  f["item_tax_id"]                  = OptionalId(line.item_tax_id);
  f["item_tax"]                     = json::Number(line.item_tax);
  f["sub_unit_id"]                  = OptionalId(line.sub_unit_id);
  f["lot_number"]                   = OptionalText(line.lot_number);
  f["mfg_date"]                     = OptionalText(line.mfg_date);
  f["exp_date"]                     = OptionalText(line.exp_date);
  f["purchase_order_line_id"]       = OptionalId(line.purchase_order_line_id);
  f["purchase_requisition_line_id"] = OptionalId(line.purchase_requisition_line_id);
  return out;
}

google::protobuf::Value PayloadBuilder::Payment(const db::model::PurchasePaymentRecord& payment) {
  google::protobuf::Value out;
  auto&                   f = *out.mutable_struct_value()->mutable_fields();

  f["amount"]     = json::Number(payment.amount);
  f["method"]     = json::Text(payment.method);
  f["account_id"] = OptionalId(payment.account_id);
  f["note"]       = OptionalText(payment.note);
  if (!payment.paid_on.empty()) f["paid_on"] = json::Text(WireDate(payment.paid_on));
  return out;
}

google::protobuf::Struct PayloadBuilder::Build(const db::model::PurchaseHeaderRecord&               header,
                                               const std::vector<db::model::PurchaseLineRecord>&    lines,
                                               const std::vector<db::model::PurchasePaymentRecord>& payments) {
  google::protobuf::Struct out;
  auto&                    f = *out.mutable_fields();

  f["contact_id"]       = json::Number(static_cast<double>(header.supplier_id));
  f["location_id"]      = json::Number(static_cast<double>(header.location_id));
  f["ref_no"]           = header.ref_no ? json::Text(*header.ref_no) : json::Null();
  f["status"]           = json::Text(db::model::ToString(header.status));
  f["transaction_date"] = json::Text(WireDate(header.transaction_date));
  f["total_before_tax"] = json::Number(header.total_before_tax);
  f["discount_type"]    = json::Text(db::model::ToString(header.discount_type));
  f["discount_amount"]  = json::Number(header.discount_amount);
  f["tax_id"]           = OptionalId(header.tax_id);
  f["tax_amount"]       = json::Number(header.tax_amount);
  f["shipping_charges"] = json::Number(header.shipping_charges);
  f["shipping_details"] = json::Text(header.shipping_details);
  f["final_total"]      = json::Number(header.final_total);
  f["additional_notes"] = json::Text(header.additional_notes);

  auto* purchases = f["purchases"].mutable_list_value();
  for (const auto& line : lines) *purchases->add_values() = Line(line);

  if (!payments.empty()) {
    auto* list = f["payments"].mutable_list_value();
    for (const auto& payment : payments) *list->add_values() = Payment(payment);
  }
  return out;
}

} // namespace purchase::sync
