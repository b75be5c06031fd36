#pragma once

#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/purchase_header_record.hpp"
#include "internal/db/model/purchase_line_record.hpp"
#include "internal/db/model/purchase_payment_record.hpp"

namespace purchase::sync {

/*
  Remote create/update body for one purchase.

  Lines go under "purchases"; "payments" is emitted only when there is
  at least one. A tax id of 0 is sent as null, as are unset optionals.
*/
class PayloadBuilder {
 public:
  static google::protobuf::Struct Build(const db::model::PurchaseHeaderRecord&               header,
                                        const std::vector<db::model::PurchaseLineRecord>&    lines,
                                        const std::vector<db::model::PurchasePaymentRecord>& payments);

  static google::protobuf::Value Line(const db::model::PurchaseLineRecord& line);
  static google::protobuf::Value Payment(const db::model::PurchasePaymentRecord& payment);
};

} // namespace purchase::sync
