#include "internal/cache/backend.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "internal/cache/json_backend.hpp"
#include "internal/cache/sqlite_kv_backend.hpp"
#include "internal/observability/logging.hpp"

namespace catalog::cache {

std::unique_ptr<Backend> SelectBackend(const std::filesystem::path& dir) {
  if (!std::filesystem::exists(dir) || std::filesystem::is_empty(dir)) {
    return std::make_unique<SqliteKvBackend>(dir);
  }

  std::vector<std::unique_ptr<Backend>> candidates;
  candidates.push_back(std::make_unique<SqliteKvBackend>(dir));
  candidates.push_back(std::make_unique<JsonBackend>(dir));

  std::unique_ptr<Backend> selected;
  int                      matches = 0;
  for (auto& candidate : candidates) {
    if (candidate->IsCachePresent()) {
      ++matches;
      selected = std::move(candidate);
    }
  }
  if (matches != 1) {
    throw std::runtime_error("cache directory has unexpected contents: " + dir.string());
  }

  CATALOG_LOG_DEBUG("selected cache backend", {observability::StringField("backend", selected->Name()),
                                               observability::StringField("dir", dir.string())});
  return selected;
}

void ValidateKeyPart(const std::string& part) {
  if (part.empty() || part == "." || part == ".." || part.find('/') != std::string::npos || part.find('\\') != std::string::npos ||
      part.find('\0') != std::string::npos) {
    throw std::runtime_error("invalid cache key component \"" + part + "\"");
  }
}

void WriteFileAtomic(const std::filesystem::path& path, std::string_view bytes) {
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("open " + tmp.string() + " for writing failed");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      throw std::runtime_error("write " + tmp.string() + " failed");
    }
  }
  std::filesystem::rename(tmp, path);
}

std::string ReadFileBytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("open " + path.string() + " failed");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string SerializeDeterministic(const google::protobuf::Message& message) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream stream(&out);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    if (!message.SerializeToCodedStream(&coded)) {
      throw std::runtime_error("serialize " + std::string(message.GetTypeName()) + " failed");
    }
  }
  return out;
}

void TrimListedBundle(registry::v1::Bundle& bundle) {
  if (!bundle.bundle_path().empty()) {
    bundle.clear_csv_json();
    bundle.clear_object();
  }
}

} // namespace catalog::cache
