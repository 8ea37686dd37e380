#ifndef HASHVOTE_POW_VERIFIER_H
#define HASHVOTE_POW_VERIFIER_H

#include "BlockHasher.h"
#include "Difficulty.h"

namespace hv {
namespace pow {

/**
 * Recompute the block hash for `nonce` and check it against the target.
 * Invalid bits never verify.
 */
bool verify(const BlockFields &fields, uint64_t nonce, int bits);
bool verify(const BlockFields &fields, uint64_t nonce, const Target &target);

} // namespace pow
} // namespace hv

#endif // HASHVOTE_POW_VERIFIER_H
