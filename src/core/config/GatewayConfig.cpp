#include "GatewayConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace mgw {

namespace {

template <typename T>
T number_or(const GatewayConfig::Lookup& lookup, const char* key, T defval) {
  auto v = lookup(key);
  if (!v || v->empty()) return defval;
  try {
    std::size_t pos = 0;
    const long long n = std::stoll(*v, &pos);
    if (pos != v->size() || n <= 0) throw std::invalid_argument(*v);
    if (static_cast<unsigned long long>(n) >
        static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
      throw std::out_of_range(*v);
    }
    return static_cast<T>(n);
  } catch (const std::exception&) {
    spdlog::warn("ignoring invalid {}={}, using {}", key, *v, defval);
    return defval;
  }
}

std::string string_or(const GatewayConfig::Lookup& lookup, const char* key, const std::string& defval) {
  auto v = lookup(key);
  return (v && !v->empty()) ? *v : defval;
}

bool flag_or(const GatewayConfig::Lookup& lookup, const char* key, bool defval) {
  auto v = lookup(key);
  if (!v || v->empty()) return defval;
  if (*v == "1" || *v == "true" || *v == "yes" || *v == "on") return true;
  if (*v == "0" || *v == "false" || *v == "no" || *v == "off") return false;
  spdlog::warn("ignoring invalid {}={}", key, *v);
  return defval;
}

} // namespace

GatewayConfig GatewayConfig::load(const Lookup& lookup) {
  GatewayConfig c;
  c.host = string_or(lookup, "MGW_HOST", c.host);

  c.port = number_or(lookup, "MGW_PORT", c.port);
  if (c.port > 65535) {
    spdlog::warn("ignoring invalid MGW_PORT={}, using 8080", c.port);
    c.port = 8080;
  }

  const std::string storage = string_or(lookup, "MGW_STORAGE", "fs");
  if (storage == "fs") c.storage = Storage::Filesystem;
  else if (storage == "memory") c.storage = Storage::Memory;
  else throw std::invalid_argument("MGW_STORAGE must be 'fs' or 'memory', got '" + storage + "'");
  c.storageRoot = string_or(lookup, "MGW_STORAGE_ROOT", c.storageRoot);

  const std::string registry = string_or(lookup, "MGW_REGISTRY", "sqlite");
  if (registry == "sqlite") c.registry = Registry::Sqlite;
  else if (registry == "memory") c.registry = Registry::Memory;
  else throw std::invalid_argument("MGW_REGISTRY must be 'sqlite' or 'memory', got '" + registry + "'");
  c.dbPath = string_or(lookup, "MGW_DB_PATH", c.dbPath);
  c.schemaPath = string_or(lookup, "MGW_SCHEMA_PATH", c.schemaPath);

  c.chunkSize = std::clamp(number_or(lookup, "MGW_CHUNK_SIZE", c.chunkSize), kMinChunk, kMaxChunk);
  c.maxUploadBytes = number_or(lookup, "MGW_MAX_UPLOAD_BYTES", c.maxUploadBytes);
  c.threads = number_or(lookup, "MGW_THREADS", c.threads);
  c.restrictTypes = flag_or(lookup, "MGW_RESTRICT_TYPES", c.restrictTypes);
  c.logLevel = string_or(lookup, "MGW_LOG_LEVEL", c.logLevel);
  return c;
}

GatewayConfig GatewayConfig::fromEnvironment() {
  return load([](const char* key) -> std::optional<std::string> {
    if (const char* v = std::getenv(key)) return std::string(v);
    return std::nullopt;
  });
}

} // namespace mgw
