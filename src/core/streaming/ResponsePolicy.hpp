#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mgw {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Headers every 200/206 media response carries.
//
// "Content-Disposition: inline" without a filename attribute keeps
// browsers from offering "save as"; together with the no-cache set it
// removes the default download affordances. It is not an access control:
// a client can still keep whatever bytes it receives.
HeaderList inline_media_headers(const std::string& contentType);

// "bytes 0-99/1000"
std::string content_range(int64_t start, int64_t end, int64_t total);

// "bytes */1000"
std::string unsatisfied_content_range(int64_t total);

} // namespace mgw
