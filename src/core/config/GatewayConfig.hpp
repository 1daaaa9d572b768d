#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace mgw {

struct GatewayConfig {
  enum class Storage { Filesystem, Memory };
  enum class Registry { Sqlite, Memory };

  std::string host = "0.0.0.0";
  int         port = 8080;
  Storage     storage = Storage::Filesystem;
  std::string storageRoot = "data/objects";
  Registry    registry = Registry::Sqlite;
  std::string dbPath = "data/media-metadata.db";
  std::string schemaPath;            // empty: search the usual places
  std::size_t chunkSize = 256 * 1024;
  std::size_t maxUploadBytes = 512u * 1024 * 1024;
  int         threads = 8;
  bool        restrictTypes = true;
  std::string logLevel = "info";

  static constexpr std::size_t kMinChunk = 4 * 1024;
  static constexpr std::size_t kMaxChunk = 4 * 1024 * 1024;

  using Lookup = std::function<std::optional<std::string>(const char*)>;

  // Reads MGW_* variables through lookup. Malformed numbers fall back to the
  // default; unknown storage/registry names throw std::invalid_argument.
  static GatewayConfig load(const Lookup& lookup);

  static GatewayConfig fromEnvironment();
};

} // namespace mgw
