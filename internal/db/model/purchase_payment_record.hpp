#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace purchase::db::model {

struct PurchasePaymentRecord {
  std::int64_t id          = 0;
  std::int64_t purchase_id = 0;

  // assigned by the remote service once the owning header syncs
  std::optional<std::int64_t> remote_payment_id;

  std::string                 method;
  double                      amount = 0.0;
  std::string                 note;
  std::optional<std::int64_t> account_id;
  std::string                 paid_on;
};

} // namespace purchase::db::model
