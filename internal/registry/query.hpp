#pragma once

#include <functional>
#include <string>
#include <vector>

#include "catalog/registry/v1/registry.pb.h"
#include "internal/model/bundle.hpp"

namespace catalog::registry {

// Receives one bundle at a time; returning false stops the stream.
using BundleSender = std::function<bool(const v1::Bundle&)>;

/*
  Read side of the catalog.

  Implemented over the relational store (SqlQuerier) and over a built
  cache (cache::Cache). Both give the same answers for the same graph.
  Lookups that find nothing throw util::NotFound.
*/
class Query {
 public:
  virtual ~Query() = default;

  virtual std::vector<std::string> ListPackages() const = 0;
  virtual v1::Package GetPackage(const std::string& name) const = 0;

  // Single bundles come back with replaces and skips cleared.
  virtual v1::Bundle GetBundle(const std::string& pkg, const std::string& channel, const std::string& csv_name) const = 0;
  virtual v1::Bundle GetBundleForChannel(const std::string& pkg, const std::string& channel) const = 0;
  virtual v1::Bundle GetBundleThatReplaces(const std::string& name, const std::string& pkg, const std::string& channel) const = 0;

  virtual std::vector<v1::ChannelEntry> GetChannelEntriesThatReplace(const std::string& name) const = 0;
  virtual std::vector<v1::ChannelEntry> GetChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const = 0;

  // Channel heads only.
  virtual std::vector<v1::ChannelEntry> GetLatestChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const = 0;

  // Latest provider in the default channel of the lexically first package.
  virtual v1::Bundle GetBundleThatProvides(const model::GroupVersionKind& gvk) const;

  // Manifest content is trimmed from bundles that carry a bundle path.
  virtual void SendBundles(const BundleSender& send) const = 0;

  std::vector<v1::Bundle> ListBundles() const;
};

std::string Describe(const model::GroupVersionKind& gvk);

v1::ChannelEntry MakeChannelEntry(const std::string& pkg, const std::string& channel, const std::string& bundle, const std::string& replaces);

} // namespace catalog::registry
