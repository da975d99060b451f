#include "version.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

namespace rdsync::util {

namespace {

std::vector<uint64_t> Components(std::string_view version) {
  std::vector<uint64_t> parts;
  uint64_t              current  = 0;
  bool                  in_digit = false;

  for (char c : version) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      current  = current * 10 + static_cast<uint64_t>(c - '0');
      in_digit = true;
      continue;
    }
    if (c == '.') {
      parts.push_back(current);
      current  = 0;
      in_digit = false;
      continue;
    }
    // first non-numeric character ends the comparable prefix
    break;
  }

  if (in_digit || !parts.empty()) parts.push_back(current);
  return parts;
}

} // namespace

int CompareVersions(std::string_view lhs, std::string_view rhs) {
  const auto a = Components(lhs);
  const auto b = Components(rhs);

  const auto count = a.size() > b.size() ? a.size() : b.size();
  for (std::size_t i = 0; i < count; ++i) {
    const uint64_t x = i < a.size() ? a[i] : 0;
    const uint64_t y = i < b.size() ? b[i] : 0;
    if (x < y) return -1;
    if (x > y) return 1;
  }
  return 0;
}

bool IsVersionSatisfied(std::string_view required, std::string_view running) {
  if (required.empty()) return true;
  return CompareVersions(required, running) <= 0;
}

} // namespace rdsync::util
