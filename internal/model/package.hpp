#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/model/bundle.hpp"

namespace catalog::model {

/*
  Replacement graph of one channel.

  nodes maps every bundle to the set of bundles it replaces (directly or
  through a skip). The head is the only node nothing replaces.
*/
struct Channel {
  BundleKey                                 head;
  std::map<BundleKey, std::set<BundleKey>>  nodes;
};

struct Package {
  std::string                    name;
  std::string                    default_channel;
  std::map<std::string, Channel> channels;
};

struct PackageChannel {
  std::string name;
  std::string current_csv_name;
};

/*
  Channel declaration for one package as supplied by the manifest layer.
*/
struct PackageManifest {
  std::string                 package_name;
  std::vector<PackageChannel> channels;
  std::string                 default_channel_name;
};

struct ChannelEntry {
  std::string package_name;
  std::string channel_name;
  std::string bundle_name;
  std::string replaces;
};

// Channel entry row joined with bundle identity for both ends of the edge.
struct AnnotatedChannelEntry {
  std::string package_name;
  std::string channel_name;
  std::string bundle_name;
  std::string bundle_path;
  std::string version;
  std::string replaces;
  std::string replaces_version;
  std::string replaces_bundle_path;
};

} // namespace catalog::model
