#pragma once
#include <stdexcept>
#include <string>

namespace mgw {

// Unknown media id (or an id that has been deleted).
class NotFoundError : public std::runtime_error {
public:
  explicit NotFoundError(const std::string& id)
    : std::runtime_error("media not found: " + id), id_(id) {}

  const std::string& id() const { return id_; }

private:
  std::string id_;
};

// Backing store unreachable, or a read/write against it failed.
// The message is for logs only; clients get a generic body.
class StorageFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Client sent something that cannot be stored (empty file, type not allowed).
class InvalidUpload : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace mgw
