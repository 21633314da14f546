#include "internal/declcfg/declcfg.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "catalog/declcfg/v1/declcfg.pb.h"
#include "internal/model/properties.hpp"
#include "internal/util/bounded_queue.hpp"
#include "internal/util/error_group.hpp"
#include "internal/util/yaml_value.hpp"

namespace catalog::declcfg {

namespace {

bool IsJsonFile(const std::filesystem::path& path) {
  return path.extension() == ".json";
}

bool IsYamlFile(const std::filesystem::path& path) {
  return path.extension() == ".yaml" || path.extension() == ".yml";
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("open " + path.string() + ": failed");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

Meta ParseMeta(std::string blob, const std::filesystem::path& file) {
  v1::Meta header;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(blob, &header, options);
  if (!status.ok()) {
    throw std::runtime_error("parse meta in " + file.string() + ": " + std::string(status.message()));
  }
  if (header.schema().empty()) {
    throw std::runtime_error("parse meta in " + file.string() + ": missing schema");
  }
  return Meta{header.schema(), header.package(), header.name(), std::move(blob)};
}

} // namespace

const std::string& Meta::OwnerPackage() const {
  return schema == model::kSchemaPackage ? name : package;
}

std::vector<std::string> SplitJsonStream(std::string_view text, const std::string& origin) {
  std::vector<std::string> out;
  int                      depth     = 0;
  bool                     in_string = false;
  bool                     escaped   = false;
  std::size_t              start     = 0;

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    switch (c) {
      case '"':
        in_string = true;
        break;
      case '{':
        if (depth++ == 0) start = i;
        break;
      case '}':
        if (depth == 0) {
          throw std::runtime_error("parse " + origin + ": unbalanced '}' at offset " + std::to_string(i));
        }
        if (--depth == 0) out.emplace_back(text.substr(start, i - start + 1));
        break;
      case ' ':
      case '\t':
      case '\r':
      case '\n':
        break;
      default:
        if (depth == 0) {
          throw std::runtime_error("parse " + origin + ": unexpected character at offset " + std::to_string(i));
        }
    }
  }
  if (depth != 0 || in_string) {
    throw std::runtime_error("parse " + origin + ": truncated object");
  }
  return out;
}

std::vector<Meta> ReadMetas(const std::filesystem::path& file) {
  std::vector<Meta> metas;
  if (IsJsonFile(file)) {
    for (auto& blob : SplitJsonStream(ReadFile(file), file.string())) {
      metas.push_back(ParseMeta(std::move(blob), file));
    }
    return metas;
  }

  std::vector<YAML::Node> documents;
  try {
    documents = YAML::LoadAll(ReadFile(file));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("parse " + file.string() + ": " + e.what());
  }
  for (const auto& document : documents) {
    if (document.IsNull()) continue;
    metas.push_back(ParseMeta(util::YamlToJson(document), file));
  }
  return metas;
}

std::vector<std::filesystem::path> ListCatalogFiles(const std::filesystem::path& root) {
  if (!std::filesystem::is_directory(root)) {
    throw std::runtime_error("catalog directory " + root.string() + " not found");
  }
  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
    if (entry.is_regular_file() && (IsJsonFile(entry.path()) || IsYamlFile(entry.path()))) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

void WalkMetas(const std::filesystem::path& root, unsigned concurrency, const MetaFunc& fn, std::stop_token stop) {
  const auto files = ListCatalogFiles(root);

  if (concurrency <= 1) {
    for (const auto& file : files) {
      if (stop.stop_requested()) {
        throw std::runtime_error("catalog walk cancelled");
      }
      for (auto& meta : ReadMetas(file)) {
        fn(file, std::move(meta));
      }
    }
    return;
  }

  util::BoundedQueue<std::filesystem::path> queue(concurrency);
  util::ErrorGroup                          group(stop);

  for (unsigned i = 0; i < concurrency; ++i) {
    group.Go([&](std::stop_token token) {
      while (auto file = queue.Pop()) {
        if (token.stop_requested()) return;
        for (auto& meta : ReadMetas(*file)) {
          fn(*file, std::move(meta));
        }
      }
    });
  }
  group.Go([&](std::stop_token token) {
    for (const auto& file : files) {
      if (token.stop_requested() || !queue.Push(file)) break;
    }
    queue.Close();
  });

  std::stop_callback close_on_stop(group.Token(), [&queue] { queue.Close(); });
  group.Wait();
  if (stop.stop_requested()) {
    throw std::runtime_error("catalog walk cancelled");
  }
}

} // namespace catalog::declcfg
