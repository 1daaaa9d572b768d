#pragma once
#include <string>

namespace mgw {

// Registry schema version written to PRAGMA user_version.
constexpr int kSchemaVersion = 1;

// Creates the database (and its parent directory) if needed and brings it to
// kSchemaVersion by applying the schema file in one transaction. Returns true
// if the schema was applied, false if the database was already current.
// Throws StorageFailure, also for a database written by a newer schema.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace mgw
