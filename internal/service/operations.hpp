#pragma once

#include <string>

#include "internal/util/fingerprint.hpp"

namespace circulation::service {

// Operation names stored with idempotency records.
inline constexpr const char* kOpCheckout   = "checkout";
inline constexpr const char* kOpReturn     = "return";
inline constexpr const char* kOpRenew      = "renew";
inline constexpr const char* kOpReportLost = "report_lost";

inline std::string CheckoutFingerprint(const std::string& copy_id, const std::string& user_id) {
  return util::Fingerprint(kOpCheckout, {copy_id, user_id});
}

inline std::string ReturnFingerprint(const std::string& copy_id, const std::string& user_id) {
  return util::Fingerprint(kOpReturn, {copy_id, user_id});
}

inline std::string RenewFingerprint(const std::string& loan_id) {
  return util::Fingerprint(kOpRenew, {loan_id});
}

inline std::string ReportLostFingerprint(const std::string& copy_id) {
  return util::Fingerprint(kOpReportLost, {copy_id});
}

} // namespace circulation::service
