#pragma once

#include <cstdint>
#include <string>

namespace ospawn::core {

// Upper bound accepted for transport request timeouts (one hour).
inline constexpr double kMaxRequestTimeoutMs = 3600.0 * 1000.0;

// Decimal digits only; no sign, no whitespace, value must fit in 32 bits.
bool parseUint32(const std::string& text, std::uint32_t* out);

// Accepts 0 < ms <= kMaxRequestTimeoutMs and rounds to whole milliseconds.
bool requestTimeoutFromMs(double ms, unsigned int* out);

}  // namespace ospawn::core
