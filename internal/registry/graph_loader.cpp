#include "internal/registry/graph_loader.hpp"

#include <map>
#include <set>

#include "internal/registry/querier.hpp"
#include "internal/util/errors.hpp"

namespace catalog::registry {

namespace {

struct ChannelBuild {
  model::Channel                          channel;
  std::map<std::string, model::BundleKey> candidates;
};

} // namespace

GraphLoader::GraphLoader(const SqlQuerier& querier) : querier_(querier) {
}

model::Package GraphLoader::Generate(const std::string& package_name) const {
  std::vector<std::string> errors;
  auto                     graph = Generate(package_name, errors);
  util::ThrowIfAny(std::move(errors));
  return graph;
}

model::Package GraphLoader::Generate(const std::string& package_name, std::vector<std::string>& channel_errors) const {
  model::Package graph;
  graph.name            = package_name;
  graph.default_channel = querier_.GetDefaultChannelForPackage(package_name);

  std::set<std::string> real;
  for (const auto& key : querier_.GetBundlesForPackage(package_name)) {
    real.insert(key.csv_name);
  }

  std::map<std::string, ChannelBuild> builds;
  std::map<std::string, std::set<std::string>> replaced_names;

  for (const auto& entry : querier_.GetChannelEntriesFromPackage(package_name)) {
    auto& build = builds[entry.channel_name];

    if (real.contains(entry.bundle_name)) {
      model::BundleKey key{entry.bundle_path, entry.version, entry.bundle_name};
      auto&            replaced = build.channel.nodes[key];
      build.candidates.emplace(entry.bundle_name, key);
      if (!entry.replaces.empty()) {
        replaced.insert(model::BundleKey{entry.replaces_bundle_path, entry.replaces_version, entry.replaces});
      }
    }
    if (!entry.replaces.empty()) {
      replaced_names[entry.channel_name].insert(entry.replaces);
    }
  }

  for (auto& [name, build] : builds) {
    for (const auto& replaced : replaced_names[name]) {
      build.candidates.erase(replaced);
    }

    if (build.candidates.empty()) {
      channel_errors.push_back("no channel head found in graph for channel " + name);
      continue;
    }
    if (build.candidates.size() > 1) {
      std::string names;
      for (const auto& [candidate, key] : build.candidates) {
        if (!names.empty()) names += ", ";
        names += candidate;
      }
      channel_errors.push_back("multiple candidate channel heads found for channel " + name + ": " + names);
      continue;
    }

    build.channel.head = build.candidates.begin()->second;
    graph.channels.emplace(name, std::move(build.channel));
  }
  return graph;
}

} // namespace catalog::registry
