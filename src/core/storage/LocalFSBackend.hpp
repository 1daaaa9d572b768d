#pragma once
#include <string>
#include <string_view>

#include "ObjectStore.hpp"

namespace mgw {

// One file per media id directly under root. The file name is the id,
// never anything derived from the client's filename. Content type lives in
// the metadata registry, not on disk.
class LocalFSBackend : public ObjectStore {
public:
  explicit LocalFSBackend(std::string root);

  void put(const std::string& id,
           std::string_view bytes,
           const std::string& contentType) override;
  int64_t getSize(const std::string& id) const override;
  std::unique_ptr<ObjectReader> openReader(const std::string& id) const override;
  bool exists(const std::string& id) const override;
  bool remove(const std::string& id) override;

  const std::string& root() const { return root_; }

private:
  std::string pathFor(const std::string& id) const;

  std::string root_;
};

} // namespace mgw
