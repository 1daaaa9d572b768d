#pragma once
#include <optional>
#include <string>
#include <vector>

#include "MediaDescriptor.hpp"

namespace mgw {

// id -> descriptor. Injected into the service; implementations must allow
// concurrent readers. Write failures throw StorageFailure.
class MetadataRegistry {
public:
  virtual ~MetadataRegistry() = default;

  virtual std::optional<MediaDescriptor> find(const std::string& id) const = 0;

  // Throws StorageFailure if the id is already registered or the write fails.
  virtual void insert(const MediaDescriptor& d) = 0;

  // Returns false if the id was not registered.
  virtual bool remove(const std::string& id) = 0;

  // Insertion order, oldest first.
  virtual std::vector<MediaDescriptor> list() const = 0;
};

} // namespace mgw
