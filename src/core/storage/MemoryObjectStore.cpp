#include "MemoryObjectStore.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>

#include "core/Errors.hpp"

namespace mgw {

namespace {

class BlobReader : public ObjectReader {
public:
  explicit BlobReader(std::shared_ptr<const MemoryObjectStore::Blob> blob)
    : blob_(std::move(blob)) {}

  int64_t size() const override { return static_cast<int64_t>(blob_->bytes.size()); }

  std::size_t readAt(int64_t offset, char* buf, std::size_t len) override {
    const auto& b = blob_->bytes;
    if (offset < 0 || static_cast<std::size_t>(offset) >= b.size()) return 0;
    const std::size_t n = std::min(len, b.size() - static_cast<std::size_t>(offset));
    std::memcpy(buf, b.data() + offset, n);
    return n;
  }

private:
  std::shared_ptr<const MemoryObjectStore::Blob> blob_;
};

} // namespace

void MemoryObjectStore::put(const std::string& id,
                            std::string_view bytes,
                            const std::string& contentType) {
  auto blob = std::make_shared<const Blob>(Blob{std::string(bytes), contentType});
  std::unique_lock lock(mu_);
  blobs_[id] = std::move(blob);
}

std::shared_ptr<const MemoryObjectStore::Blob> MemoryObjectStore::find(const std::string& id) const {
  std::shared_lock lock(mu_);
  auto it = blobs_.find(id);
  if (it == blobs_.end()) throw NotFoundError(id);
  return it->second;
}

int64_t MemoryObjectStore::getSize(const std::string& id) const {
  return static_cast<int64_t>(find(id)->bytes.size());
}

std::unique_ptr<ObjectReader> MemoryObjectStore::openReader(const std::string& id) const {
  return std::make_unique<BlobReader>(find(id));
}

bool MemoryObjectStore::exists(const std::string& id) const {
  std::shared_lock lock(mu_);
  return blobs_.count(id) != 0;
}

bool MemoryObjectStore::remove(const std::string& id) {
  std::unique_lock lock(mu_);
  return blobs_.erase(id) != 0;
}

std::string MemoryObjectStore::contentTypeOf(const std::string& id) const {
  return find(id)->contentType;
}

std::size_t MemoryObjectStore::count() const {
  std::shared_lock lock(mu_);
  return blobs_.size();
}

} // namespace mgw
