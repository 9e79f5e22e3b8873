#include "logk/status.hpp"

namespace logk {

const char* status_name(Status s) noexcept {
  switch (s) {
    case Status::Ok:                return "Ok";
    case Status::MissingInput:      return "MissingInput";
    case Status::MissingOutput:     return "MissingOutput";
    case Status::ContractViolation: return "ContractViolation";
    case Status::Unknown:           return "Unknown";
  }
  return "Unknown";
}

} // namespace logk
