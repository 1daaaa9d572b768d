#include "MediaJson.hpp"

#include "core/util/Ids.hpp"

namespace mgw {

void to_json(nlohmann::json& j, const MediaDescriptor& d) {
  j = nlohmann::json{
    {"media_id", d.id},
    {"filename", d.filename},
    {"content_type", d.contentType},
    {"size", d.sizeBytes},
    {"upload_time", format_iso8601(d.uploadTime)},
    {"media_type", to_string(d.mediaType)},
    {"stream_url", stream_url_for(d.id)},
  };
}

nlohmann::json upload_response(const MediaDescriptor& d) {
  return {
    {"success", true},
    {"media_id", d.id},
    {"filename", d.filename},
    {"size", d.sizeBytes},
    {"content_type", d.contentType},
    {"stream_url", stream_url_for(d.id)},
  };
}

} // namespace mgw
