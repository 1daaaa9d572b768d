#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace mgw {

// Outcome of matching a Range request header against a resource of known
// length. start/end are inclusive and only meaningful when Satisfiable.
struct RangeResult {
  enum class Kind {
    NoRange,        // serve the whole resource (200)
    Satisfiable,    // serve [start, end] (206)
    Unsatisfiable,  // 416 with "Content-Range: bytes */T"
  };

  Kind    kind = Kind::NoRange;
  int64_t start = 0;
  int64_t end = 0;

  static RangeResult none() { return {}; }
  static RangeResult unsatisfiable() { return {Kind::Unsatisfiable, 0, 0}; }
  static RangeResult satisfiable(int64_t s, int64_t e) { return {Kind::Satisfiable, s, e}; }

  int64_t length() const { return kind == Kind::Satisfiable ? end - start + 1 : 0; }
};

/**
 * Parse a "Range" request header against a resource of total bytes.
 *
 * An absent (or blank) header yields NoRange. A present header that is
 * malformed, uses a unit other than "bytes", or selects nothing inside
 * [0, total) yields Unsatisfiable. For "bytes=a-b,c-d" only the first
 * range is considered.
 */
RangeResult parse_range(std::optional<std::string_view> header, int64_t total);

} // namespace mgw
