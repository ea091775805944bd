#include "common/errors.hpp"

namespace agro {

const char* ToString(FailureKind kind) {
  switch (kind) {
    case FailureKind::kInputValidation:    return "InputValidationError";
    case FailureKind::kCoveragePlanning:   return "CoveragePlanningFailure";
    case FailureKind::kCapacityExceeded:   return "CapacityExceeded";
    case FailureKind::kTransitUnreachable: return "TransitUnreachable";
  }
  return "MissionBuildError";
}

} // namespace agro
