// src/core/types.cpp
#include "runbox/core/types.hpp"

namespace runbox {

const char* outcome_kind_name(ExecutionOutcome::Kind kind) noexcept {
  switch (kind) {
    case ExecutionOutcome::Kind::kSuccess: return "Success";
    case ExecutionOutcome::Kind::kFailure: return "Failure";
    case ExecutionOutcome::Kind::kTimedOut: return "TimedOut";
    case ExecutionOutcome::Kind::kLaunchError: return "LaunchError";
  }
  return "LaunchError";
}

}  // namespace runbox
