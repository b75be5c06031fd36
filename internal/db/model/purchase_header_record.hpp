#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace purchase::db::model {

enum class PurchaseStatus { kOrdered, kPending, kPartial, kReceived, kCancelled };

enum class DiscountType { kFixed, kPercentage };

enum class SyncState { kUnsynced = 0, kSynced = 1 };

struct PurchaseHeaderRecord {
  std::int64_t                local_id = 0;
  std::optional<std::int64_t> remote_id;

  std::int64_t               supplier_id = 0;
  std::int64_t               location_id = 0;
  std::optional<std::string> ref_no;
  PurchaseStatus             status = PurchaseStatus::kOrdered;
  std::string                transaction_date;

  double                      total_before_tax = 0.0;
  double                      discount_amount  = 0.0;
  DiscountType                discount_type    = DiscountType::kFixed;
  std::optional<std::int64_t> tax_id;
  double                      tax_amount       = 0.0;
  double                      shipping_charges = 0.0;
  std::string                 shipping_details;
  double                      final_total = 0.0;
  std::string                 additional_notes;

  SyncState sync_state = SyncState::kUnsynced;
};

// Wire/storage spelling: "ordered", "received", ...
const char*                   ToString(PurchaseStatus status);
std::optional<PurchaseStatus> ParsePurchaseStatus(const std::string& text);

const char*                 ToString(DiscountType type);
std::optional<DiscountType> ParseDiscountType(const std::string& text);

} // namespace purchase::db::model
