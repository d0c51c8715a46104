#include "fingerprint.hpp"

#include <cstdint>

namespace circulation::util {

namespace {

constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime  = 1099511628211ULL;
constexpr char     kSeparator = '\x1f';

void Mix(uint64_t& hash, std::string_view bytes) {
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  hash ^= static_cast<unsigned char>(kSeparator);
  hash *= kFnvPrime;
}

} // namespace

std::string Fingerprint(std::string_view operation, std::initializer_list<std::string_view> params) {
  uint64_t hash = kFnvOffset;
  Mix(hash, operation);
  for (auto param : params) {
    Mix(hash, param);
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<size_t>(i)] = kHex[hash & 0x0F];
    hash >>= 4;
  }
  return out;
}

} // namespace circulation::util
