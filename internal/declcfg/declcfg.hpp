#pragma once

#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace catalog::declcfg {

/*
  One declarative catalog object as found on disk.

  blob holds the object as compact JSON; YAML documents are converted on
  read.
*/
struct Meta {
  std::string schema;
  std::string package;
  std::string name;
  std::string blob;

  // olm.package metas own themselves
  const std::string& OwnerPackage() const;
};

// Splits a stream of concatenated JSON objects. Braces inside strings are ignored.
std::vector<std::string> SplitJsonStream(std::string_view text, const std::string& origin);

// Metas of one *.json, *.yaml or *.yml file, in file order.
std::vector<Meta> ReadMetas(const std::filesystem::path& file);

// Catalog files below root, recursively, in sorted order.
std::vector<std::filesystem::path> ListCatalogFiles(const std::filesystem::path& root);

using MetaFunc = std::function<void(const std::filesystem::path& file, Meta&& meta)>;

/*
  Calls fn for every meta below root.

  With concurrency 1 files are visited in sorted order on the calling
  thread. Otherwise files are parsed by `concurrency` workers and fn runs
  on those workers, so it must synchronize itself. The first failure, or
  a stop request, ends the walk.
*/
void WalkMetas(const std::filesystem::path& root, unsigned concurrency, const MetaFunc& fn, std::stop_token stop = {});

} // namespace catalog::declcfg
