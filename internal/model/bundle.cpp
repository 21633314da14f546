#include "internal/model/bundle.hpp"

namespace catalog::model {

std::string ToString(const BundleKey& key) {
  if (key.version.empty() && key.bundle_path.empty()) {
    return key.csv_name;
  }
  return key.csv_name + " (" + key.version + ", " + key.bundle_path + ")";
}

} // namespace catalog::model
