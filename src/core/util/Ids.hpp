#pragma once
#include <cstdint>
#include <string>

namespace mgw {

// Random RFC 4122 version 4 UUID, lower-case hex with dashes.
std::string uuid4();

// Milliseconds since the unix epoch, UTC.
int64_t now_millis();

// "2026-10-18T09:30:00.123Z"
std::string format_iso8601(int64_t epochMillis);

} // namespace mgw
