#pragma once

#include <string>

#include "internal/collab/identity.hpp"
#include "internal/util/time.hpp"

namespace circulation::core {

// Per-request inputs the engine needs besides the operation parameters.
struct OperationContext {
  collab::Caller caller;

  // Idempotency key of the request; stamped on loan and audit events.
  std::string correlation_id;

  util::Deadline deadline = util::Deadline::max();
};

} // namespace circulation::core
