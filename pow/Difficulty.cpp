#include "Difficulty.h"
#include "../lib/Utilities.h"

#include <cstring>

namespace hv {
namespace pow {

bool isValidBits(int bits) { return bits >= MIN_BITS && bits <= MAX_BITS; }

Roe<Target> computeTarget(int bits) {
  if (!isValidBits(bits)) {
    return Error(E_INVALID_BITS, "Difficulty bits must be in [0, 256], got " +
                                     std::to_string(bits));
  }

  Target target;
  target.bits = bits;
  size_t zeroBytes = static_cast<size_t>(bits / 8);
  int rem = bits % 8;
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    if (i < zeroBytes) {
      target.bytes[i] = 0x00;
    } else if (i == zeroBytes && rem != 0) {
      target.bytes[i] = static_cast<uint8_t>((1u << (8 - rem)) - 1);
    } else {
      target.bytes[i] = 0xff;
    }
  }
  return target;
}

std::string targetHex(const Target &target) {
  return utl::hexEncode(std::string(
      reinterpret_cast<const char *>(target.bytes.data()), target.bytes.size()));
}

Roe<std::string> computeTargetHex(int bits) {
  auto target = computeTarget(bits);
  if (!target) {
    return target.error();
  }
  return targetHex(target.value());
}

bool meetsTarget(const Digest &digest, const Target &target) {
  return std::memcmp(digest.data(), target.bytes.data(), DIGEST_SIZE) <= 0;
}

bool meetsTarget(const std::string &hexDigest, const Target &target) {
  if (!utl::isLowerHex(hexDigest, DIGEST_SIZE * 2)) {
    return false;
  }
  std::string raw = utl::hexDecode(hexDigest);
  Digest digest;
  std::memcpy(digest.data(), raw.data(), DIGEST_SIZE);
  return meetsTarget(digest, target);
}

} // namespace pow
} // namespace hv
