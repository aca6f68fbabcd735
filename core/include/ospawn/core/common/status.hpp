#pragma once
#include <cstdint>

namespace ospawn::core {

enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,
  InvalidParameter = 2,
  NotFound = 3,
  Timeout = 4
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

const char* statusToString(Status s);

}  // namespace ospawn::core
