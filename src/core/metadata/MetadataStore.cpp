#include "MetadataStore.hpp"
#include <sqlite3.h>

#include "core/Errors.hpp"

namespace mgw {

namespace {

// Finalizes on scope exit.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt() { sqlite3_finalize(st); }
};

void prepare(sqlite3* db, const char* sql, Stmt& s, const char* what) {
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK) {
    throw StorageFailure(std::string(what) + " prepare failed: " + sqlite3_errmsg(db));
  }
}

std::string column_text(sqlite3_stmt* st, int col) {
  const auto* p = sqlite3_column_text(st, col);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

MediaDescriptor read_row(sqlite3_stmt* st) {
  MediaDescriptor d;
  d.id          = column_text(st, 0);
  d.filename    = column_text(st, 1);
  d.contentType = column_text(st, 2);
  d.sizeBytes   = sqlite3_column_int64(st, 3);
  d.uploadTime  = sqlite3_column_int64(st, 4);
  d.mediaType   = media_type_from_string(column_text(st, 5));
  return d;
}

const char* kColumns = "id, filename, content_type, size_bytes, upload_time, media_type";

} // namespace

MetadataStore::MetadataStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StorageFailure("failed to open db " + dbPath + ": " + msg);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

MetadataStore::~MetadataStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

std::optional<MediaDescriptor> MetadataStore::find(const std::string& id) const {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kColumns + " FROM media WHERE id = ?";
  std::lock_guard lock(mu_);
  Stmt s;
  prepare(db, sql.c_str(), s, "find");
  sqlite3_bind_text(s.st, 1, id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw StorageFailure(std::string("find failed: ") + sqlite3_errmsg(db));
  return read_row(s.st);
}

void MetadataStore::insert(const MediaDescriptor& d) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO media
      (id, filename, content_type, size_bytes, upload_time, media_type)
    VALUES (?,?,?,?,?,?)
  )SQL";
  std::lock_guard lock(mu_);
  Stmt s;
  prepare(db, sql, s, "insert");
  int i = 1;
  sqlite3_bind_text(s.st, i++, d.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, d.filename.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, d.contentType.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(s.st, i++, d.sizeBytes);
  sqlite3_bind_int64(s.st, i++, d.uploadTime);
  sqlite3_bind_text(s.st, i++, to_string(d.mediaType), -1, SQLITE_STATIC);

  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw StorageFailure(std::string("insert failed: ") + sqlite3_errmsg(db));
  }
}

bool MetadataStore::remove(const std::string& id) {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard lock(mu_);
  Stmt s;
  prepare(db, "DELETE FROM media WHERE id = ?", s, "remove");
  sqlite3_bind_text(s.st, 1, id.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw StorageFailure(std::string("remove failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_changes(db) > 0;
}

std::vector<MediaDescriptor> MetadataStore::list() const {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kColumns + " FROM media ORDER BY seq";
  std::lock_guard lock(mu_);
  Stmt s;
  prepare(db, sql.c_str(), s, "list");

  std::vector<MediaDescriptor> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(read_row(s.st));
  if (rc != SQLITE_DONE) throw StorageFailure(std::string("list failed: ") + sqlite3_errmsg(db));
  return out;
}

} // namespace mgw
