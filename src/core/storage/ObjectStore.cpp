#include "ObjectStore.hpp"

#include <algorithm>

#include "core/Errors.hpp"

namespace mgw {

std::string ObjectStore::getRange(const std::string& id, int64_t start, int64_t end) const {
  auto reader = openReader(id);
  const int64_t size = reader->size();
  if (start < 0 || start > end || start >= size) {
    throw std::out_of_range("getRange: range outside object " + id);
  }
  end = std::min(end, size - 1);

  std::string out(static_cast<std::size_t>(end - start + 1), '\0');
  std::size_t got = 0;
  while (got < out.size()) {
    const std::size_t n = reader->readAt(start + static_cast<int64_t>(got),
                                         out.data() + got, out.size() - got);
    if (n == 0) throw StorageFailure("getRange: short read on " + id);
    got += n;
  }
  return out;
}

} // namespace mgw
