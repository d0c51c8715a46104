#pragma once

#include <optional>

#include "internal/collab/identity.hpp"
#include "internal/util/time.hpp"

namespace circulation::service {

// Transport-independent facts about one inbound call.
struct RequestContext {
  collab::Caller                caller;
  std::optional<util::Deadline> deadline;
};

}
