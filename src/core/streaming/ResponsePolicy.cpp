#include "ResponsePolicy.hpp"

namespace mgw {

HeaderList inline_media_headers(const std::string& contentType) {
  return {
    {"Content-Type", contentType},
    {"Content-Disposition", "inline"},
    {"Cache-Control", "no-cache, no-store, must-revalidate"},
    {"Pragma", "no-cache"},
    {"Expires", "0"},
    {"Accept-Ranges", "bytes"},
    {"X-Content-Type-Options", "nosniff"},
  };
}

std::string content_range(int64_t start, int64_t end, int64_t total) {
  return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" +
         std::to_string(total);
}

std::string unsatisfied_content_range(int64_t total) {
  return "bytes */" + std::to_string(total);
}

} // namespace mgw
