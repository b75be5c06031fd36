#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "purchase_header_record.hpp"

namespace purchase::db::model {

struct PurchaseLineRecord {
  std::int64_t id          = 0;
  std::int64_t purchase_id = 0;

  std::int64_t product_id   = 0;
  std::int64_t variation_id = 0;
  double       quantity     = 0.0;
  double       unit_price   = 0.0;

  double                      line_discount_amount = 0.0;
  DiscountType                line_discount_type   = DiscountType::kFixed;
  std::optional<std::int64_t> item_tax_id;
  double                      item_tax = 0.0;
  std::optional<std::int64_t> sub_unit_id;

  std::string lot_number;
  std::string mfg_date;
  std::string exp_date;

  // provenance only; never enforced referentially
  std::optional<std::int64_t> purchase_order_line_id;
  std::optional<std::int64_t> purchase_requisition_line_id;
};

} // namespace purchase::db::model
