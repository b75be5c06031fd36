#include "reference_records.hpp"

namespace purchase::db::model {

const char* ToString(ReferenceKind kind) {
  switch (kind) {
    case ReferenceKind::kSuppliers:
      return "suppliers";
    case ReferenceKind::kProducts:
      return "products";
    case ReferenceKind::kLocations:
      return "locations";
  }
  return "unknown";
}

} // namespace purchase::db::model
