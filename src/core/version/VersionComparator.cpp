#include "core/version/VersionComparator.hpp"

#include <charconv>
#include <cstdint>
#include <vector>

namespace uds {

// -------- helpers --------

static std::vector<std::string_view> split_dots(std::string_view v) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    size_t dot = v.find('.', start);
    if (dot == std::string_view::npos) {
      parts.push_back(v.substr(start));
      return parts;
    }
    parts.push_back(v.substr(start, dot - start));
    start = dot + 1;
  }
}

static bool parse_component(std::string_view s, uint64_t& out) {
  if (s.empty()) return false;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

// -------- public --------

int compare_versions(std::string_view a, std::string_view b) {
  const auto pa = split_dots(a);
  const auto pb = split_dots(b);
  const size_t n = pa.size() > pb.size() ? pa.size() : pb.size();
  for (size_t i = 0; i < n; ++i) {
    uint64_t x = 0, y = 0;
    if (i < pa.size() && !parse_component(pa[i], x)) x = 0;
    if (i < pb.size() && !parse_component(pb[i], y)) y = 0;
    if (x > y) return 1;
    if (x < y) return -1;
  }
  return 0;
}

bool is_dotted_numeric(std::string_view v) {
  if (v.empty()) return false;
  for (auto part : split_dots(v)) {
    uint64_t ignored = 0;
    if (!parse_component(part, ignored)) return false;
  }
  return true;
}

bool is_strict_version(std::string_view v) {
  return is_dotted_numeric(v) && split_dots(v).size() == 3;
}

} // namespace uds
