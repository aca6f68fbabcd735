#include "ospawn/core/common/parse.hpp"

#include <cctype>
#include <cmath>
#include <limits>

namespace ospawn::core {

bool parseUint32(const std::string& text, std::uint32_t* out) {
  if (!out || text.empty()) return false;
  std::uint64_t value = 0;
  for (const char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + static_cast<std::uint64_t>(c - '0');
    if (value > std::numeric_limits<std::uint32_t>::max()) return false;
  }
  *out = static_cast<std::uint32_t>(value);
  return true;
}

bool requestTimeoutFromMs(double ms, unsigned int* out) {
  if (!out || !std::isfinite(ms) || !(ms > 0.0) || ms > kMaxRequestTimeoutMs) return false;
  const double rounded = std::round(ms);
  *out = rounded < 1.0 ? 1u : static_cast<unsigned int>(rounded);
  return true;
}

}  // namespace ospawn::core
