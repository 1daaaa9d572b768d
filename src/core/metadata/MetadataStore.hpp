#pragma once
#include <mutex>
#include <string>

#include "MetadataRegistry.hpp"

namespace mgw {

// SQLite-backed registry. The schema must already exist (see initDatabase).
class MetadataStore : public MetadataRegistry {
public:
  explicit MetadataStore(const std::string& dbPath);
  ~MetadataStore() override;

  MetadataStore(const MetadataStore&) = delete;
  MetadataStore& operator=(const MetadataStore&) = delete;

  std::optional<MediaDescriptor> find(const std::string& id) const override;
  void insert(const MediaDescriptor& d) override;
  bool remove(const std::string& id) override;
  std::vector<MediaDescriptor> list() const override;

private:
  void* db_; // sqlite3*
  // held per statement only; sqlite3_errmsg is per connection
  mutable std::mutex mu_;
};

} // namespace mgw
