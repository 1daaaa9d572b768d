#include "MediaDescriptor.hpp"

namespace mgw {

const char* to_string(MediaType t) {
  switch (t) {
    case MediaType::Video: return "video";
    case MediaType::Audio: return "audio";
    case MediaType::Image: return "image";
    case MediaType::Other: break;
  }
  return "other";
}

MediaType media_type_from_string(std::string_view s) {
  if (s == "video") return MediaType::Video;
  if (s == "audio") return MediaType::Audio;
  if (s == "image") return MediaType::Image;
  return MediaType::Other;
}

std::string stream_url_for(const std::string& id) {
  return "/stream/" + id;
}

} // namespace mgw
