#include "RangeParser.hpp"

#include <cctype>
#include <charconv>
#include <limits>

namespace mgw {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Whole string must be decimal digits; no sign, no overflow.
bool parse_u64(std::string_view s, uint64_t& out) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

bool consume_unit(std::string_view& s) {
  static constexpr std::string_view unit = "bytes";
  if (s.size() < unit.size()) return false;
  for (std::size_t i = 0; i < unit.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[i])) != unit[i]) return false;
  }
  s.remove_prefix(unit.size());
  s = trim(s);
  if (s.empty() || s.front() != '=') return false;
  s.remove_prefix(1);
  return true;
}

} // namespace

RangeResult parse_range(std::optional<std::string_view> header, int64_t total) {
  if (!header) return RangeResult::none();
  std::string_view s = trim(*header);
  if (s.empty()) return RangeResult::none();

  if (total < 0 || !consume_unit(s)) return RangeResult::unsatisfiable();

  // first range only
  if (const auto comma = s.find(','); comma != std::string_view::npos) {
    s = s.substr(0, comma);
  }
  s = trim(s);

  const auto dash = s.find('-');
  if (dash == std::string_view::npos) return RangeResult::unsatisfiable();

  const auto T = static_cast<uint64_t>(total);
  const std::string_view first = trim(s.substr(0, dash));
  const std::string_view last = trim(s.substr(dash + 1));

  if (first.empty()) {
    // suffix-byte-range-spec: the last N bytes
    uint64_t suffix = 0;
    if (!parse_u64(last, suffix) || suffix == 0 || T == 0) {
      return RangeResult::unsatisfiable();
    }
    const uint64_t start = suffix >= T ? 0 : T - suffix;
    return RangeResult::satisfiable(static_cast<int64_t>(start), total - 1);
  }

  uint64_t start = 0;
  if (!parse_u64(first, start)) return RangeResult::unsatisfiable();

  uint64_t end = std::numeric_limits<uint64_t>::max();
  if (!last.empty()) {
    if (!parse_u64(last, end) || end < start) return RangeResult::unsatisfiable();
  }

  if (start >= T) return RangeResult::unsatisfiable();
  if (end >= T) end = T - 1;

  return RangeResult::satisfiable(static_cast<int64_t>(start), static_cast<int64_t>(end));
}

} // namespace mgw
