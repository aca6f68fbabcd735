#include "ospawn/core/common/status.hpp"

namespace ospawn::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::NotFound: return "NotFound";
    case Status::Timeout: return "Timeout";
  }
  return "Unknown";
}

}  // namespace ospawn::core
