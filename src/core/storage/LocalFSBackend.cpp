#include "LocalFSBackend.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "core/Errors.hpp"

namespace fs = std::filesystem;

namespace mgw {

namespace {

// Generated ids are uuids; anything else reaching the backend is refused
// before it can name a path outside root.
bool is_safe_id(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  for (char c : id) {
    const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                    (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
    if (!ok) return false;
  }
  return true;
}

class FileReader : public ObjectReader {
public:
  FileReader(const std::string& path, const std::string& id) : id_(id) {
    in_.open(path, std::ios::binary);
    if (!in_) {
      throw StorageFailure("open " + path + ": " + std::strerror(errno));
    }
    in_.seekg(0, std::ios::end);
    const auto end = in_.tellg();
    if (end < 0) throw StorageFailure("cannot determine size of " + path);
    size_ = static_cast<int64_t>(end);
  }

  int64_t size() const override { return size_; }

  std::size_t readAt(int64_t offset, char* buf, std::size_t len) override {
    if (offset >= size_ || len == 0) return 0;
    in_.clear();
    in_.seekg(offset, std::ios::beg);
    if (!in_) throw StorageFailure("seek failed on object " + id_);
    in_.read(buf, static_cast<std::streamsize>(len));
    const auto n = in_.gcount();
    if (in_.bad()) throw StorageFailure("read failed on object " + id_);
    return static_cast<std::size_t>(n);
  }

private:
  std::string id_;
  std::ifstream in_;
  int64_t size_ = 0;
};

} // namespace

LocalFSBackend::LocalFSBackend(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) throw StorageFailure("cannot create storage root " + root_ + ": " + ec.message());
}

std::string LocalFSBackend::pathFor(const std::string& id) const {
  if (!is_safe_id(id)) throw NotFoundError(id);
  return (fs::path(root_) / id).string();
}

void LocalFSBackend::put(const std::string& id,
                         std::string_view bytes,
                         const std::string& /*contentType*/) {
  const fs::path file = pathFor(id);
  // write-then-rename so readers never observe a partial object
  const fs::path tmp = fs::path(root_) / ("." + id + ".part");
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw StorageFailure("open " + tmp.string() + ": " + std::strerror(errno));
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throw StorageFailure("write failed for object " + id);
    }
  }
  std::error_code ec;
  fs::rename(tmp, file, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw StorageFailure("rename failed for object " + id + ": " + ec.message());
  }
}

int64_t LocalFSBackend::getSize(const std::string& id) const {
  std::error_code ec;
  const auto n = fs::file_size(pathFor(id), ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) throw NotFoundError(id);
    throw StorageFailure("stat failed for object " + id + ": " + ec.message());
  }
  return static_cast<int64_t>(n);
}

std::unique_ptr<ObjectReader> LocalFSBackend::openReader(const std::string& id) const {
  const std::string path = pathFor(id);
  if (!exists(id)) throw NotFoundError(id);
  return std::make_unique<FileReader>(path, id);
}

bool LocalFSBackend::exists(const std::string& id) const {
  if (!is_safe_id(id)) return false;
  std::error_code ec;
  return fs::is_regular_file(fs::path(root_) / id, ec);
}

bool LocalFSBackend::remove(const std::string& id) {
  std::error_code ec;
  const bool removed = fs::remove(pathFor(id), ec);
  if (ec) throw StorageFailure("remove failed for object " + id + ": " + ec.message());
  return removed;
}

} // namespace mgw
