#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace purchase::remote {

// One entry of a remote purchase listing.
struct RemotePurchase {
  std::int64_t               remote_id   = 0;
  std::int64_t               supplier_id = 0;
  std::int64_t               location_id = 0;
  std::optional<std::string> ref_no;
  std::string                status;
  std::string                payment_status;
  std::string                transaction_date;
  double                     final_total = 0.0;
  std::string                supplier_name;
};

struct PurchasePage {
  std::vector<RemotePurchase> items;
  std::int64_t                current_page = 1;
  std::int64_t                last_page    = 1;
  std::int64_t                per_page     = 0;
  std::int64_t                total        = 0;
};

} // namespace purchase::remote
