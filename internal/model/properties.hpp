#pragma once

#include <string>
#include <string_view>

#include "internal/model/bundle.hpp"

namespace catalog::model {

inline constexpr std::string_view kGvkType         = "olm.gvk";
inline constexpr std::string_view kGvkRequiredType = "olm.gvk.required";
inline constexpr std::string_view kPackageType     = "olm.package";
inline constexpr std::string_view kDeprecatedType  = "olm.deprecated";
inline constexpr std::string_view kLabelType       = "olm.label";

inline constexpr std::string_view kSchemaPackage = "olm.package";
inline constexpr std::string_view kSchemaChannel = "olm.channel";
inline constexpr std::string_view kSchemaBundle  = "olm.bundle";

// Canonical JSON for an olm.gvk value. Both writer and readers go through
// these so stored values compare byte-for-byte.
std::string GvkValue(const GroupVersionKind& gvk);
GroupVersionKind ParseGvkValue(const std::string& json);

std::string PackageValue(const std::string& package_name, const std::string& version);
void ParsePackageValue(const std::string& json, std::string* package_name, std::string* version);

inline std::string DeprecatedValue() {
  return "{}";
}

} // namespace catalog::model
