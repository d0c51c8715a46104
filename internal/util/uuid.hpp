#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace circulation::util {

/*
  UUID helpers

  Loan and transition ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Fresh id in canonical text form.
std::string NewId();

} // namespace circulation::util
