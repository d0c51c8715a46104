#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace circulation::service {

// True for the error types callers are expected to see.
inline bool IsDomainError(const std::exception& ex) {
  return dynamic_cast<const util::NotFound*>(&ex) || dynamic_cast<const util::AlreadyExists*>(&ex) ||
         dynamic_cast<const util::Conflict*>(&ex) || dynamic_cast<const util::Forbidden*>(&ex) ||
         dynamic_cast<const util::Timeout*>(&ex) || dynamic_cast<const util::InvalidArgument*>(&ex) ||
         dynamic_cast<const util::Internal*>(&ex);
}

/*
  Runs one RPC body, logging its failure. Domain errors are rethrown as
  they are; anything else is logged with its message and replaced by a
  generic util::Internal so storage details never reach the caller.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    if (IsDomainError(ex)) {
      CIRCULATION_LOG_WARN("RPC failed", {circulation::observability::StringField("route", route),
                                          circulation::observability::StringField("error", ex.what()),
                                          circulation::observability::IntField("elapsed_ms", elapsed_ms())});
      throw;
    }
    CIRCULATION_LOG_ERROR("RPC failed", {circulation::observability::StringField("route", route),
                                         circulation::observability::StringField("error", ex.what()),
                                         circulation::observability::IntField("elapsed_ms", elapsed_ms())});
    throw util::Internal("internal error");
  }
}

} // namespace circulation::service
