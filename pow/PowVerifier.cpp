#include "PowVerifier.h"

namespace hv {
namespace pow {

bool verify(const BlockFields &fields, uint64_t nonce, int bits) {
  auto target = computeTarget(bits);
  if (!target) {
    return false;
  }
  return verify(fields, nonce, target.value());
}

bool verify(const BlockFields &fields, uint64_t nonce, const Target &target) {
  return meetsTarget(computeHash(fields, nonce), target);
}

} // namespace pow
} // namespace hv
