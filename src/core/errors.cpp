// src/core/errors.cpp
#include "abstractchain/core/errors.h"

namespace abstractchain {

const char* to_string(PlanErrorCode code) {
    switch (code) {
        case PlanErrorCode::DUPLICATE_PLACEHOLDER:  return "duplicate_placeholder";
        case PlanErrorCode::UNKNOWN_REFERENCE:      return "unknown_reference";
        case PlanErrorCode::CYCLE_DETECTED:         return "cycle_detected";
        case PlanErrorCode::UNRESOLVED_PLACEHOLDER: return "unresolved_placeholder";
        case PlanErrorCode::OVERLAPPING_SPANS:      return "overlapping_spans";
    }
    return "unknown";
}

} // namespace abstractchain
