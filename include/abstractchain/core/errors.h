// abstractchain/core/errors.h
#ifndef ABSTRACTCHAIN_CORE_ERRORS_H
#define ABSTRACTCHAIN_CORE_ERRORS_H

#include "common/types.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace abstractchain {

enum class PlanErrorCode : uint8_t {
    DUPLICATE_PLACEHOLDER,
    UNKNOWN_REFERENCE,
    CYCLE_DETECTED,
    UNRESOLVED_PLACEHOLDER,
    OVERLAPPING_SPANS
};

const char* to_string(PlanErrorCode code);

// Base class for errors that make a plan impossible to run or rewrite.
// Carries the placeholders involved so callers can report them.
class PlanError : public std::runtime_error {
public:
    PlanError(PlanErrorCode code, const std::string& message, std::vector<Placeholder> placeholders = {})
        : std::runtime_error(message),
          code_(code),
          placeholders_(std::move(placeholders)) {}

    PlanErrorCode code() const noexcept { return code_; }
    const std::vector<Placeholder>& placeholders() const noexcept { return placeholders_; }

private:
    PlanErrorCode code_;
    std::vector<Placeholder> placeholders_;
};

// Raised by GraphBuilder before any tool is invoked
class GraphError : public PlanError {
public:
    using PlanError::PlanError;
};

// Raised by PlanRewriter when text and graph disagree
class RewriteError : public PlanError {
public:
    using PlanError::PlanError;
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_CORE_ERRORS_H
