#pragma once

#include <compare>
#include <string>
#include <tuple>
#include <vector>

namespace catalog::model {

struct GroupVersionKind {
  std::string group;
  std::string version;
  std::string kind;
  std::string plural;

  auto operator<=>(const GroupVersionKind& other) const {
    return std::tie(group, version, kind) <=> std::tie(other.group, other.version, other.kind);
  }
  bool operator==(const GroupVersionKind& other) const {
    return group == other.group && version == other.version && kind == other.kind;
  }
};

// Typed fact attached to a bundle. `value` is a JSON document.
struct Property {
  std::string type;
  std::string value;

  auto operator<=>(const Property&) const = default;
};

struct Dependency {
  std::string type;
  std::string value;

  auto operator<=>(const Dependency&) const = default;
};

/*
  One immutable release of a package.

  Produced by the manifest/image unpacking layer and handed to the loader.
  Provided and required APIs are carried both here and as olm.gvk facts;
  the loader writes them as properties/dependencies respectively.
*/
struct Bundle {
  std::string name;
  std::string package;
  std::string version;
  std::string bundle_path;

  std::string              replaces;
  std::vector<std::string> skips;
  std::string              skip_range;
  std::string              substitutes_for;

  std::vector<GroupVersionKind> provided_apis;
  std::vector<GroupVersionKind> required_apis;
  std::vector<Property>         properties;
  std::vector<Dependency>       dependencies;
  std::vector<std::string>      related_images;

  // opaque manifest content
  std::string              csv_json;
  std::vector<std::string> objects;
};

/*
  Identity of a node in a channel graph.

  Synthetic skip placeholders only carry a CSV name; real bundles carry
  path and version too.
*/
struct BundleKey {
  std::string bundle_path;
  std::string version;
  std::string csv_name;

  bool IsEmpty() const {
    return bundle_path.empty() && version.empty() && csv_name.empty();
  }

  auto operator<=>(const BundleKey&) const = default;
};

std::string ToString(const BundleKey& key);

} // namespace catalog::model
