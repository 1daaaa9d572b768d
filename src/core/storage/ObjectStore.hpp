#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace mgw {

// Read handle on one stored object. The handle pins the bytes it was opened
// on: removing the object from the store does not change what an already
// open reader returns.
class ObjectReader {
public:
  virtual ~ObjectReader() = default;

  // Length of the pinned object.
  virtual int64_t size() const = 0;

  // Copies up to len bytes starting at offset into buf and returns the count.
  // Returns fewer than len only at the end of the object.
  // Throws StorageFailure on I/O errors.
  virtual std::size_t readAt(int64_t offset, char* buf, std::size_t len) = 0;
};

// Blob storage addressed by opaque media id.
// Implementations are shared by all request threads and must be thread-safe.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // Stores bytes under id, replacing any previous object atomically.
  virtual void put(const std::string& id,
                   std::string_view bytes,
                   const std::string& contentType) = 0;

  // Authoritative length. Throws NotFoundError if id is absent.
  virtual int64_t getSize(const std::string& id) const = 0;

  // Throws NotFoundError if id is absent, StorageFailure if it cannot be opened.
  virtual std::unique_ptr<ObjectReader> openReader(const std::string& id) const = 0;

  virtual bool exists(const std::string& id) const = 0;

  // Returns false if there was nothing to remove.
  virtual bool remove(const std::string& id) = 0;

  // Bytes [start, end] inclusive, clamped to the object length.
  // Meant for small reads; streaming goes through openReader().
  std::string getRange(const std::string& id, int64_t start, int64_t end) const;
};

} // namespace mgw
