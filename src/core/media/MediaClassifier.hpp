#pragma once
#include <string>
#include <string_view>

#include "core/metadata/MediaDescriptor.hpp"

namespace mgw {

// Lower-cased extension including the dot (".mp4"), or "" if there is none.
std::string file_extension(std::string_view filename);

// MIME type for a known media extension, or "" if unknown.
std::string guess_content_type(std::string_view filename);

// Declared type wins unless it is empty or the generic
// application/octet-stream; then the extension is consulted.
std::string resolve_content_type(std::string_view declared, std::string_view filename);

// Content type is authoritative; the extension only decides when the
// content type is not video/, audio/ or image/.
MediaType classify_media(std::string_view contentType, std::string_view filename);

// True if the extension is on the video/audio/image allow list.
bool is_allowed_extension(std::string_view filename);

} // namespace mgw
