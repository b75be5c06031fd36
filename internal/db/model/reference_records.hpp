#pragma once

#include <cstdint>
#include <string>

namespace purchase::db::model {

/*
  Denormalized snapshots of remote reference data. Each table is
  replaced wholesale on refresh.
*/

enum class ReferenceKind { kSuppliers, kProducts, kLocations };

const char* ToString(ReferenceKind kind);

struct SupplierRecord {
  std::int64_t id = 0;
  std::string  name;
  std::string  business_name;
  std::string  mobile;
  std::string  address_line_1;
  std::string  city;
  std::string  state;
  std::string  country;
  std::string  zip_code;
  std::string  contact_code;
  std::string  pay_term_type;
  std::int64_t pay_term_number = 0;
  double       balance         = 0.0;
};

struct ProductRecord {
  std::int64_t product_id = 0;
  std::string  product_name;
  std::string  product_type;
  std::int64_t variation_id = 0;
  std::string  variation_name;
  std::string  sub_sku;
  double       default_purchase_price = 0.0;
};

struct LocationRecord {
  std::int64_t id = 0;
  std::string  name;
  std::string  location_code;
  std::string  address;
  std::string  city;
  std::string  state;
  std::string  country;
  std::string  zip_code;
};

} // namespace purchase::db::model
