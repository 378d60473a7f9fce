#pragma once

#include <cstdint>

#include "rulegraph/v1/types.pb.h"

namespace rulegraph::effects {

using ExecutionState = rulegraph::v1::ExecutionState;

// PENDING -> APPLYING -> {SUCCEEDED, FAILED}; PENDING may also fail directly
// (validation rejects before anything is applied).
constexpr bool IsTerminal(ExecutionState state) {
  return state == rulegraph::v1::EXECUTION_STATE_SUCCEEDED || state == rulegraph::v1::EXECUTION_STATE_FAILED;
}

constexpr bool CanTransition(ExecutionState from, ExecutionState to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case rulegraph::v1::EXECUTION_STATE_UNSPECIFIED:
      return to == rulegraph::v1::EXECUTION_STATE_PENDING;
    case rulegraph::v1::EXECUTION_STATE_PENDING:
      return to == rulegraph::v1::EXECUTION_STATE_APPLYING || to == rulegraph::v1::EXECUTION_STATE_FAILED;
    case rulegraph::v1::EXECUTION_STATE_APPLYING:
      return to == rulegraph::v1::EXECUTION_STATE_SUCCEEDED || to == rulegraph::v1::EXECUTION_STATE_FAILED;
    default:
      return false;
  }
}

} // namespace rulegraph::effects
