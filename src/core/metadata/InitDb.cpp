// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace mgw {

namespace {

// Closes on scope exit.
struct Connection {
  sqlite3* db = nullptr;
  ~Connection() { sqlite3_close(db); }
};

void exec(sqlite3* db, const std::string& sql, const char* what) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw StorageFailure(std::string(what) + " failed: " + msg);
  }
}

int user_version(sqlite3* db) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "PRAGMA user_version", -1, &st, nullptr) != SQLITE_OK) {
    throw StorageFailure(std::string("reading schema version failed: ") + sqlite3_errmsg(db));
  }
  const int version = sqlite3_step(st) == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
  sqlite3_finalize(st);
  return version;
}

std::string read_schema(const std::string& schemaPath) {
  std::ifstream in(schemaPath);
  if (!in) throw StorageFailure("cannot open schema file: " + schemaPath);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

} // namespace

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const std::string schema = read_schema(schemaPath);

  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  Connection c;
  if (sqlite3_open_v2(dbPath.c_str(), &c.db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    throw StorageFailure("failed to open db " + dbPath + ": " +
                         (c.db ? sqlite3_errmsg(c.db) : "out of memory"));
  }
  sqlite3_busy_timeout(c.db, 5000);

  // journal mode cannot change inside a transaction
  exec(c.db, "PRAGMA journal_mode=WAL;", "enabling WAL");
  exec(c.db, "PRAGMA synchronous=NORMAL;", "setting synchronous");

  // IMMEDIATE so two starting processes do not both apply the schema
  exec(c.db, "BEGIN IMMEDIATE;", "starting schema transaction");
  try {
    const int found = user_version(c.db);
    if (found > kSchemaVersion) {
      throw StorageFailure(dbPath + " has schema version " + std::to_string(found) +
                           ", this build supports up to " + std::to_string(kSchemaVersion));
    }
    if (found == kSchemaVersion) {
      exec(c.db, "COMMIT;", "closing schema transaction");
      return false;
    }
    exec(c.db, schema, "applying schema");
    exec(c.db, "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";", "recording schema version");
    exec(c.db, "COMMIT;", "committing schema");
    spdlog::info("registry schema at {} upgraded from version {} to {}", dbPath, found, kSchemaVersion);
    return true;
  } catch (const std::exception&) {
    sqlite3_exec(c.db, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

} // namespace mgw
