#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/core/purchase_service.hpp"

namespace purchase::core {

/*
  Reads a purchase draft from the same JSON shape the remote API accepts
  ("contact_id", "purchases" for lines, optional "payments"). Throws
  util::InvalidArgument on malformed input.
*/
PurchaseDraft DraftFromJson(const google::protobuf::Value& value);
PurchaseDraft DraftFromJson(const std::string& text);

// Listing/detail rendering for purchasectl.
std::string DetailToJson(const PurchaseDetail& detail);

} // namespace purchase::core
