#pragma once
#include <map>
#include <shared_mutex>
#include <string>

#include "ObjectStore.hpp"

namespace mgw {

// Objects held in process memory. Readers share ownership of the blob, so a
// removal only drops the store's reference.
class MemoryObjectStore : public ObjectStore {
public:
  void put(const std::string& id,
           std::string_view bytes,
           const std::string& contentType) override;
  int64_t getSize(const std::string& id) const override;
  std::unique_ptr<ObjectReader> openReader(const std::string& id) const override;
  bool exists(const std::string& id) const override;
  bool remove(const std::string& id) override;

  std::string contentTypeOf(const std::string& id) const;
  std::size_t count() const;

  struct Blob {
    std::string bytes;
    std::string contentType;
  };

private:
  std::shared_ptr<const Blob> find(const std::string& id) const;

  mutable std::shared_mutex mu_;
  std::map<std::string, std::shared_ptr<const Blob>> blobs_;
};

} // namespace mgw
