#include "MediaClassifier.hpp"

#include <algorithm>
#include <cctype>

namespace mgw {

namespace {

struct ExtensionInfo {
  const char* ext;
  const char* mime;
  MediaType   type;
};

const ExtensionInfo kExtensions[] = {
  {".mp4",  "video/mp4",        MediaType::Video},
  {".avi",  "video/x-msvideo",  MediaType::Video},
  {".mov",  "video/quicktime",  MediaType::Video},
  {".wmv",  "video/x-ms-wmv",   MediaType::Video},
  {".flv",  "video/x-flv",      MediaType::Video},
  {".webm", "video/webm",       MediaType::Video},
  {".mkv",  "video/x-matroska", MediaType::Video},
  {".mp3",  "audio/mpeg",       MediaType::Audio},
  {".wav",  "audio/wav",        MediaType::Audio},
  {".ogg",  "audio/ogg",        MediaType::Audio},
  {".m4a",  "audio/mp4",        MediaType::Audio},
  {".flac", "audio/flac",       MediaType::Audio},
  {".jpg",  "image/jpeg",       MediaType::Image},
  {".jpeg", "image/jpeg",       MediaType::Image},
  {".png",  "image/png",        MediaType::Image},
  {".gif",  "image/gif",        MediaType::Image},
  {".webp", "image/webp",       MediaType::Image},
  {".bmp",  "image/bmp",        MediaType::Image},
};

const ExtensionInfo* lookup(std::string_view filename) {
  const std::string ext = file_extension(filename);
  if (ext.empty()) return nullptr;
  for (const auto& e : kExtensions) {
    if (ext == e.ext) return &e;
  }
  return nullptr;
}

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string file_extension(std::string_view filename) {
  const auto slash = filename.find_last_of("/\\");
  if (slash != std::string_view::npos) filename.remove_prefix(slash + 1);
  const auto dot = filename.find_last_of('.');
  // ".bashrc" style names have no extension
  if (dot == std::string_view::npos || dot == 0) return {};
  return lower(filename.substr(dot));
}

std::string guess_content_type(std::string_view filename) {
  if (const auto* e = lookup(filename)) return e->mime;
  return {};
}

std::string resolve_content_type(std::string_view declared, std::string_view filename) {
  const std::string d = lower(declared);
  if (!d.empty() && d != "application/octet-stream") return std::string(declared);
  std::string guessed = guess_content_type(filename);
  if (!guessed.empty()) return guessed;
  return "application/octet-stream";
}

MediaType classify_media(std::string_view contentType, std::string_view filename) {
  const std::string ct = lower(contentType);
  if (starts_with(ct, "video/")) return MediaType::Video;
  if (starts_with(ct, "audio/")) return MediaType::Audio;
  if (starts_with(ct, "image/")) return MediaType::Image;
  if (const auto* e = lookup(filename)) return e->type;
  return MediaType::Other;
}

bool is_allowed_extension(std::string_view filename) {
  return lookup(filename) != nullptr;
}

} // namespace mgw
