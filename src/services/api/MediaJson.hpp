#pragma once
#include <nlohmann/json.hpp>

#include "core/metadata/MediaDescriptor.hpp"

namespace mgw {

// {media_id, filename, content_type, size, upload_time, media_type, stream_url}
void to_json(nlohmann::json& j, const MediaDescriptor& d);

// POST /upload response body.
nlohmann::json upload_response(const MediaDescriptor& d);

} // namespace mgw
