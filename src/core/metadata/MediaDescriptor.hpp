#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace mgw {

enum class MediaType { Video, Audio, Image, Other };

const char* to_string(MediaType t);
MediaType media_type_from_string(std::string_view s);

struct MediaDescriptor {
  std::string id;
  std::string filename;      // display only, never used to build paths
  std::string contentType;
  int64_t     sizeBytes = 0;
  int64_t     uploadTime = 0; // unix epoch, milliseconds (UTC)
  MediaType   mediaType = MediaType::Other;
};

// "/stream/<id>"
std::string stream_url_for(const std::string& id);

} // namespace mgw
