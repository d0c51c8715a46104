#include "policy.hpp"

#include "internal/util/time.hpp"

namespace circulation::config {

namespace {

void Override(std::chrono::milliseconds& target, bool present, const google::protobuf::Duration& value) {
  if (!present) return;
  const auto ms = util::ToMillis(value);
  if (ms.count() > 0) target = ms;
}

void Override(uint32_t& target, uint32_t value) {
  if (value > 0) target = value;
}

} // namespace

Policy ResolvePolicy(const circulation::runtime::config::RuntimeConfig& config) {
  Policy policy;

  const auto& loans = config.loans();
  Override(policy.loan_period, loans.has_loan_period(), loans.loan_period());
  Override(policy.max_renewals, loans.max_renewals());
  Override(policy.max_active_loans_per_user, loans.max_active_loans_per_user());

  policy.suspended_users.assign(config.users().suspended().begin(), config.users().suspended().end());

  const auto& idempotency = config.idempotency();
  Override(policy.idempotency_retention, idempotency.has_retention(), idempotency.retention());
  Override(policy.in_flight_lease, idempotency.has_in_flight_lease(), idempotency.in_flight_lease());
  Override(policy.poll_interval, idempotency.has_poll_interval(), idempotency.poll_interval());

  Override(policy.default_request_timeout, config.requests().has_default_timeout(), config.requests().default_timeout());

  const auto& maintenance = config.maintenance();
  Override(policy.maintenance_interval, maintenance.has_interval(), maintenance.interval());
  Override(policy.audit_retry_attempts, maintenance.audit_retry_attempts());

  return policy;
}

} // namespace circulation::config
