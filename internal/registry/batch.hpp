#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace catalog::registry {

enum class BatchMode {
  kPermissive, // log and continue
  kStrict,     // stop at the first failure
};

/*
  Collects per-item failures of a batch operation.

  Items committed before a failure stay committed in both modes.
*/
class BatchErrors {
 public:
  BatchErrors(std::string_view operation, BatchMode mode) : operation_(operation), mode_(mode) {
  }

  // Call from a catch handler. Rethrows in strict mode.
  void Record(std::string_view item, const std::exception& e) {
    if (mode_ == BatchMode::kStrict) {
      throw;
    }
    CATALOG_LOG_WARN("batch item failed", {observability::StringField("operation", operation_), observability::StringField("item", item),
                                           observability::StringField("error", e.what())});
    messages_.push_back(std::string(item) + ": " + e.what());
  }

  void ThrowIfAny() {
    util::ThrowIfAny(std::move(messages_));
  }

 private:
  std::string              operation_;
  BatchMode                mode_;
  std::vector<std::string> messages_;
};

} // namespace catalog::registry
