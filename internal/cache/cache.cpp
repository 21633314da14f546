#include "internal/cache/cache.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string_view>
#include <thread>
#include <tuple>

#include "internal/declcfg/convert.hpp"
#include "internal/declcfg/declcfg.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/bounded_queue.hpp"
#include "internal/util/error_group.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace catalog::cache {

using observability::IntField;
using observability::StringField;
using registry::MakeChannelEntry;

namespace {

// Location of one meta inside the build buffer.
struct MetaRange {
  std::string file;
  std::size_t ordinal = 0;
  std::size_t offset  = 0;
  std::size_t length  = 0;
};

void ClearGraphFields(registry::v1::Bundle& bundle) {
  bundle.clear_replaces();
  bundle.clear_skips();
}

void SortEntries(std::vector<registry::v1::ChannelEntry>& entries) {
  auto key = [](const registry::v1::ChannelEntry& e) { return std::tie(e.package_name(), e.channel_name(), e.bundle_name(), e.replaces()); };
  std::sort(entries.begin(), entries.end(), [&](const auto& a, const auto& b) { return key(a) < key(b); });
  entries.erase(std::unique(entries.begin(), entries.end(), [&](const auto& a, const auto& b) { return key(a) == key(b); }), entries.end());
}

} // namespace

Cache::Cache(std::unique_ptr<Backend> backend) : backend_(std::move(backend)) {
}

Cache::~Cache() {
  backend_->Close();
}

void Cache::CheckIntegrity(const std::filesystem::path& source) {
  if (!backend_->IsCachePresent()) {
    observability::Metrics::Instance().RecordCacheIntegrity(backend_->Name(), false);
    throw util::IntegrityError("cache requires rebuild: no " + std::string(backend_->Name()) + " cache present");
  }

  const auto existing = backend_->GetDigest();
  const auto computed = backend_->ComputeDigest(source);
  const bool match    = existing == computed;
  observability::Metrics::Instance().RecordCacheIntegrity(backend_->Name(), match);

  if (!match) {
    CATALOG_LOG_WARN("cache requires rebuild", {StringField("existing_digest", existing), StringField("computed_digest", computed)});
    throw util::IntegrityError("cache requires rebuild: cache reports digest as \"" + existing + "\", but computed digest is \"" + computed + "\"");
  }
}

void Cache::Build(const std::filesystem::path& source, std::stop_token stop, unsigned concurrency) {
  observability::SpanScope span("cache.build");
  span.SetAttribute("cache.backend", backend_->Name());

  const auto started_at = std::chrono::steady_clock::now();
  if (concurrency == 0) concurrency = std::max(1u, std::thread::hardware_concurrency());
  CATALOG_LOG_INFO("building cache", {StringField("backend", backend_->Name()), StringField("source", source.string()),
                                      IntField("concurrency", concurrency)});

  backend_->Init();

  // group blobs by owning package in one buffer
  std::mutex                                    walk_mutex;
  std::string                                   buffer;
  std::map<std::string, std::vector<MetaRange>> by_package;
  std::map<std::string, std::size_t>            ordinals;

  declcfg::WalkMetas(
      source, concurrency,
      [&](const std::filesystem::path& file, declcfg::Meta&& meta) {
        const auto& owner = meta.OwnerPackage();
        if (owner.empty()) {
          CATALOG_LOG_DEBUG("skipping meta without package", {StringField("file", file.string()), StringField("schema", meta.schema)});
          return;
        }
        std::lock_guard lock(walk_mutex);
        const auto      path = file.string();
        by_package[owner].push_back(MetaRange{path, ordinals[path]++, buffer.size(), meta.blob.size()});
        buffer += meta.blob;
      },
      stop);

  std::mutex                               index_mutex;
  std::map<std::string, v1::IndexedPackage> converted;

  {
    util::BoundedQueue<std::string> packages(concurrency);
    util::ErrorGroup                group(stop);

    for (unsigned i = 0; i < concurrency; ++i) {
      group.Go([&](std::stop_token token) {
        while (auto name = packages.Pop()) {
          if (token.stop_requested()) return;

          auto ranges = by_package.at(*name);
          std::sort(ranges.begin(), ranges.end(),
                    [](const MetaRange& a, const MetaRange& b) { return std::tie(a.file, a.ordinal) < std::tie(b.file, b.ordinal); });
          std::vector<std::string_view> blobs;
          for (const auto& range : ranges) {
            blobs.emplace_back(std::string_view(buffer).substr(range.offset, range.length));
          }

          auto model = declcfg::ConvertPackage(*name, blobs);
          for (const auto& bundle : model.bundles) {
            if (token.stop_requested()) return;
            backend_->PutBundle(BundleKey{bundle.package_name(), bundle.channel_name(), bundle.csv_name()}, bundle);
          }

          std::lock_guard lock(index_mutex);
          converted.emplace(*name, std::move(model.index));
        }
      });
    }
    group.Go([&](std::stop_token token) {
      for (const auto& [name, ranges] : by_package) {
        if (token.stop_requested() || !packages.Push(name)) break;
      }
      packages.Close();
    });

    std::stop_callback close_on_stop(group.Token(), [&packages] { packages.Close(); });
    group.Wait();
  }
  if (stop.stop_requested()) {
    throw std::runtime_error("cache build cancelled");
  }

  v1::PackageIndex index;
  for (auto& [name, package] : converted) {
    *index.add_packages() = std::move(package);
  }
  backend_->PutPackageIndex(index);
  backend_->PutDigest(backend_->ComputeDigest(source));

  const double elapsed_ms = util::MillisSince(started_at);
  observability::Metrics::Instance().ObserveCacheBuildDurationMs(backend_->Name(), elapsed_ms);
  CATALOG_LOG_INFO("cache built", {StringField("backend", backend_->Name()), IntField("packages", index.packages_size()),
                                   IntField("duration_ms", static_cast<int64_t>(elapsed_ms))});
}

void Cache::Load() {
  index_ = PackageIndex(backend_->GetPackageIndex());
  CATALOG_LOG_INFO("cache loaded", {StringField("backend", backend_->Name()), IntField("packages", static_cast<int64_t>(index_.Packages().size()))});
}

void Cache::LoadOrRebuild(const std::filesystem::path& source, unsigned concurrency) {
  try {
    CheckIntegrity(source);
  } catch (const util::IntegrityError& e) {
    CATALOG_LOG_INFO("rebuilding cache", {StringField("reason", e.what())});
    Build(source, {}, concurrency);
  }
  Load();
}

// ------------------------------------------------------------------
// Query
// ------------------------------------------------------------------

bool Cache::Provides(const v1::IndexedBundle& indexed, const model::GroupVersionKind& gvk) const {
  const auto bundle = backend_->GetBundle(BundleKey{indexed.package(), indexed.channel(), indexed.name()});
  for (const auto& api : bundle.provided_apis()) {
    if (api.group() == gvk.group && api.version() == gvk.version && api.kind() == gvk.kind) {
      return true;
    }
  }
  return false;
}

const IndexedChannel& Cache::RequireChannel(const std::string& pkg, const std::string& channel) const {
  if (!index_.FindPackage(pkg)) {
    throw util::NotFound("package " + pkg + " not found");
  }
  const auto* found = index_.FindChannel(pkg, channel);
  if (!found) {
    throw util::NotFound("no entry found for " + pkg + " " + channel);
  }
  return *found;
}

std::vector<std::string> Cache::ListPackages() const {
  std::vector<std::string> names;
  for (const auto& [name, package] : index_.Packages()) {
    names.push_back(name);
  }
  return names;
}

registry::v1::Package Cache::GetPackage(const std::string& name) const {
  const auto* package = index_.FindPackage(name);
  if (!package) {
    throw util::NotFound("package " + name + " not found");
  }
  registry::v1::Package out;
  out.set_name(package->name);
  out.set_default_channel_name(package->default_channel);
  for (const auto& [channel_name, channel] : package->channels) {
    auto* entry = out.add_channels();
    entry->set_name(channel_name);
    entry->set_csv_name(channel.head);
  }
  return out;
}

registry::v1::Bundle Cache::GetBundle(const std::string& pkg, const std::string& channel, const std::string& csv_name) const {
  const auto* found = index_.FindChannel(pkg, channel);
  if (!found || !found->Contains(csv_name)) {
    throw util::NotFound("no entry found for " + pkg + " " + channel + " " + csv_name);
  }
  auto bundle = backend_->GetBundle(BundleKey{pkg, channel, csv_name});
  ClearGraphFields(bundle);
  return bundle;
}

registry::v1::Bundle Cache::GetBundleForChannel(const std::string& pkg, const std::string& channel) const {
  const auto& found = RequireChannel(pkg, channel);
  return GetBundle(pkg, channel, found.head);
}

registry::v1::Bundle Cache::GetBundleThatReplaces(const std::string& name, const std::string& pkg, const std::string& channel) const {
  const auto& found = RequireChannel(pkg, channel);
  for (const auto& [bundle_name, bundle] : found.bundles) {
    if (BundleReplaces(bundle, name)) {
      return GetBundle(pkg, channel, bundle_name);
    }
  }
  throw util::NotFound("no entry found for " + pkg + " " + channel);
}

std::vector<registry::v1::ChannelEntry> Cache::GetChannelEntriesThatReplace(const std::string& name) const {
  std::vector<registry::v1::ChannelEntry> out;
  for (const auto& [package_name, package] : index_.Packages()) {
    for (const auto& [channel_name, channel] : package.channels) {
      for (const auto& [bundle_name, bundle] : channel.bundles) {
        if (BundleReplaces(bundle, name)) {
          out.push_back(MakeChannelEntry(package_name, channel_name, bundle_name, name));
        }
      }
    }
  }
  if (out.empty()) {
    throw util::NotFound("no channel entries found that replace " + name);
  }
  return out;
}

std::vector<registry::v1::ChannelEntry> Cache::GetChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const {
  std::vector<registry::v1::ChannelEntry> out;
  for (const auto& [package_name, package] : index_.Packages()) {
    for (const auto& [channel_name, channel] : package.channels) {
      for (const auto& [bundle_name, bundle] : channel.bundles) {
        if (!Provides(bundle, gvk)) continue;
        out.push_back(MakeChannelEntry(package_name, channel_name, bundle_name, bundle.replaces()));
        for (const auto& skip : bundle.skips()) {
          if (skip != bundle.replaces()) out.push_back(MakeChannelEntry(package_name, channel_name, bundle_name, skip));
        }
      }
    }
  }
  if (out.empty()) {
    throw util::NotFound("no channel entries found that provide " + registry::Describe(gvk));
  }
  SortEntries(out);
  return out;
}

std::vector<registry::v1::ChannelEntry> Cache::GetLatestChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const {
  std::vector<registry::v1::ChannelEntry> out;
  for (const auto& [package_name, package] : index_.Packages()) {
    for (const auto& [channel_name, channel] : package.channels) {
      auto head = channel.bundles.find(channel.head);
      if (head == channel.bundles.end() || !Provides(head->second, gvk)) continue;

      const auto& bundle = head->second;
      out.push_back(MakeChannelEntry(package_name, channel_name, bundle.name(), bundle.replaces()));

      std::set<std::string> skips(bundle.skips().begin(), bundle.skips().end());
      for (const auto& skip : skips) {
        if (skip != bundle.replaces() && channel.Contains(skip)) {
          out.push_back(MakeChannelEntry(package_name, channel_name, bundle.name(), skip));
        }
      }
    }
  }
  if (out.empty()) {
    throw util::NotFound("no channel entries found that provide " + registry::Describe(gvk));
  }
  return out;
}

void Cache::SendBundles(const registry::BundleSender& send) const {
  backend_->SendBundles(send);
}

std::unique_ptr<Cache> Open(const std::filesystem::path& dir) {
  auto backend = SelectBackend(dir);
  if (backend->IsCachePresent()) {
    backend->Open();
  }
  return std::make_unique<Cache>(std::move(backend));
}

} // namespace catalog::cache
