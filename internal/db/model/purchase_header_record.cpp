#include "purchase_header_record.hpp"

namespace purchase::db::model {

const char* ToString(PurchaseStatus status) {
  switch (status) {
    case PurchaseStatus::kOrdered:
      return "ordered";
    case PurchaseStatus::kPending:
      return "pending";
    case PurchaseStatus::kPartial:
      return "partial";
    case PurchaseStatus::kReceived:
      return "received";
    case PurchaseStatus::kCancelled:
      return "cancelled";
  }
  return "ordered";
}

std::optional<PurchaseStatus> ParsePurchaseStatus(const std::string& text) {
  if (text == "ordered") return PurchaseStatus::kOrdered;
  if (text == "pending") return PurchaseStatus::kPending;
  if (text == "partial") return PurchaseStatus::kPartial;
  if (text == "received") return PurchaseStatus::kReceived;
  if (text == "cancelled") return PurchaseStatus::kCancelled;
  return std::nullopt;
}

const char* ToString(DiscountType type) {
  return type == DiscountType::kPercentage ? "percentage" : "fixed";
}

std::optional<DiscountType> ParseDiscountType(const std::string& text) {
  if (text == "fixed") return DiscountType::kFixed;
  if (text == "percentage") return DiscountType::kPercentage;
  return std::nullopt;
}

} // namespace purchase::db::model
