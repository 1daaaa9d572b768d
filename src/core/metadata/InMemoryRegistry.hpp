#pragma once
#include <cstdint>
#include <map>
#include <shared_mutex>

#include "MetadataRegistry.hpp"

namespace mgw {

class InMemoryRegistry : public MetadataRegistry {
public:
  std::optional<MediaDescriptor> find(const std::string& id) const override;
  void insert(const MediaDescriptor& d) override;
  bool remove(const std::string& id) override;
  std::vector<MediaDescriptor> list() const override;

private:
  struct Entry {
    uint64_t        seq;
    MediaDescriptor descriptor;
  };

  mutable std::shared_mutex mu_;
  std::map<std::string, Entry> byId_;
  uint64_t nextSeq_ = 0;
};

} // namespace mgw
