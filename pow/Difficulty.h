#ifndef HASHVOTE_DIFFICULTY_H
#define HASHVOTE_DIFFICULTY_H

#include "BlockHasher.h"
#include "../lib/ResultOrError.hpp"

#include <string>

namespace hv {
namespace pow {

struct Error : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

constexpr int32_t E_INVALID_BITS = 1;

constexpr int MIN_BITS = 0;
constexpr int MAX_BITS = 256;

/**
 * Difficulty threshold for a number of leading zero bits.
 * Holds the largest passing digest, 2^(256-bits) - 1, as 32 big endian
 * bytes. A digest passes iff digest <= bytes, i.e. digest < 2^(256-bits).
 */
struct Target {
  int bits{ 0 };
  Digest bytes{};
};

bool isValidBits(int bits);

/**
 * Build the target for `bits` leading zero bits
 * @return Target, or E_INVALID_BITS outside [0, 256]
 */
Roe<Target> computeTarget(int bits);

/**
 * Render a target as 64 lowercase hex characters: bits/8 "00" bytes, then
 * one partial byte 2^(8-bits%8)-1 if bits%8 != 0, then "ff" bytes.
 */
std::string targetHex(const Target &target);
Roe<std::string> computeTargetHex(int bits);

bool meetsTarget(const Digest &digest, const Target &target);

/**
 * Same predicate on a 64 character hex digest. Malformed digests fail.
 */
bool meetsTarget(const std::string &hexDigest, const Target &target);

} // namespace pow
} // namespace hv

#endif // HASHVOTE_DIFFICULTY_H
