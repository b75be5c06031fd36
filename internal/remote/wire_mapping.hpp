#pragma once

#include <cstdint>
#include <optional>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/purchase_payment_record.hpp"
#include "internal/db/model/reference_records.hpp"
#include "internal/remote/remote_purchase.hpp"

namespace purchase::remote {

/*
  JSON -> record mapping for remote payloads. Each returns nullopt when
  the entry lacks the identifier it is keyed by.
*/

std::optional<RemotePurchase> RemotePurchaseFromJson(const google::protobuf::Value& v);

std::optional<db::model::SupplierRecord> SupplierFromJson(const google::protobuf::Value& v);
std::optional<db::model::ProductRecord>  ProductFromJson(const google::protobuf::Value& v);
std::optional<db::model::LocationRecord> LocationFromJson(const google::protobuf::Value& v);

// Remote-confirmed payment; purchase_id is the local header id.
db::model::PurchasePaymentRecord PaymentFromJson(const google::protobuf::Value& v, std::int64_t purchase_id);

} // namespace purchase::remote
