// src/main.cpp
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/GatewayConfig.hpp"
#include "core/media/MediaService.hpp"
#include "core/metadata/InMemoryRegistry.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/MemoryObjectStore.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath(const mgw::GatewayConfig& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) {
    if (fs::exists(cfg.schemaPath)) return cfg.schemaPath;
    throw std::runtime_error("MGW_SCHEMA_PATH does not exist: " + cfg.schemaPath);
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/metadata)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve       # start HTTP server (MGW_PORT or 8080)\n";
}

static std::unique_ptr<mgw::MetadataRegistry> makeRegistry(const mgw::GatewayConfig& cfg) {
  if (cfg.registry == mgw::GatewayConfig::Registry::Memory) {
    spdlog::warn("using in-memory registry; descriptors are lost on exit");
    return std::make_unique<mgw::InMemoryRegistry>();
  }
  // Self-heal DB on startup (idempotent)
  mgw::initDatabase(cfg.dbPath, findSchemaPath(cfg));
  return std::make_unique<mgw::MetadataStore>(cfg.dbPath);
}

static std::unique_ptr<mgw::ObjectStore> makeObjectStore(const mgw::GatewayConfig& cfg) {
  if (cfg.storage == mgw::GatewayConfig::Storage::Memory) {
    spdlog::warn("using in-memory object store; media is lost on exit");
    return std::make_unique<mgw::MemoryObjectStore>();
  }
  return std::make_unique<mgw::LocalFSBackend>(cfg.storageRoot);
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const auto cfg = mgw::GatewayConfig::fromEnvironment();
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      const bool applied = mgw::initDatabase(cfg.dbPath, findSchemaPath(cfg));
      std::cout << (applied ? "DB initialized at: " : "DB already current at: ") << cfg.dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      auto registry = makeRegistry(cfg);
      auto store = makeObjectStore(cfg);

      mgw::ServiceOptions opts;
      opts.restrictTypes = cfg.restrictTypes;
      opts.chunkSize = cfg.chunkSize;
      mgw::MediaService service(*registry, *store, opts);

      mgw::run_http_server(service, cfg);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    spdlog::critical("Fatal: {}", e.what());
    return 2;
  }
}
