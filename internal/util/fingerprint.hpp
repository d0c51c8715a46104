#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace circulation::util {

/*
  Stable operation fingerprint for idempotency records.

  FNV-1a 64 over the operation name and its essential parameters, each
  terminated by a unit separator so ("ab","c") and ("a","bc") differ.
  Persisted, so the hash must not change across builds or processes.
*/
std::string Fingerprint(std::string_view operation, std::initializer_list<std::string_view> params);

} // namespace circulation::util
