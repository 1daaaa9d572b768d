#include "InMemoryRegistry.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "core/Errors.hpp"

namespace mgw {

std::optional<MediaDescriptor> InMemoryRegistry::find(const std::string& id) const {
  std::shared_lock lock(mu_);
  auto it = byId_.find(id);
  if (it == byId_.end()) return std::nullopt;
  return it->second.descriptor;
}

void InMemoryRegistry::insert(const MediaDescriptor& d) {
  std::unique_lock lock(mu_);
  if (byId_.count(d.id)) throw StorageFailure("duplicate media id " + d.id);
  byId_.emplace(d.id, Entry{nextSeq_++, d});
}

bool InMemoryRegistry::remove(const std::string& id) {
  std::unique_lock lock(mu_);
  return byId_.erase(id) != 0;
}

std::vector<MediaDescriptor> InMemoryRegistry::list() const {
  std::vector<std::pair<uint64_t, MediaDescriptor>> rows;
  {
    std::shared_lock lock(mu_);
    rows.reserve(byId_.size());
    for (const auto& [id, e] : byId_) rows.emplace_back(e.seq, e.descriptor);
  }
  std::sort(rows.begin(), rows.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  std::vector<MediaDescriptor> out;
  out.reserve(rows.size());
  for (auto& r : rows) out.push_back(std::move(r.second));
  return out;
}

} // namespace mgw
