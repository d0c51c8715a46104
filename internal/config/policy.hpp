#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace circulation::config {

/*
  RuntimeConfig with defaults applied. Zero or unset values fall back to
  the defaults below.
*/
struct Policy {
  std::chrono::milliseconds loan_period{std::chrono::hours(24 * 14)};
  uint32_t                  max_renewals              = 2;
  uint32_t                  max_active_loans_per_user = 5;

  std::vector<std::string> suspended_users;

  std::chrono::milliseconds idempotency_retention{std::chrono::hours(24)};
  std::chrono::milliseconds in_flight_lease{std::chrono::seconds(60)};
  std::chrono::milliseconds poll_interval{20};

  std::chrono::milliseconds default_request_timeout{std::chrono::seconds(5)};

  std::chrono::milliseconds maintenance_interval{std::chrono::seconds(60)};
  uint32_t                  audit_retry_attempts = 3;
};

Policy ResolvePolicy(const circulation::runtime::config::RuntimeConfig& config);

} // namespace circulation::config
