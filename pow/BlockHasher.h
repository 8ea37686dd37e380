#ifndef HASHVOTE_BLOCK_HASHER_H
#define HASHVOTE_BLOCK_HASHER_H

#include <array>
#include <cstdint>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace hv {
namespace pow {

// Genesis sentinel used as prevHash of the first block of every poll
extern const std::string GENESIS_HASH;

constexpr size_t DIGEST_SIZE = 32;
using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * Vote fields covered by the block hash, excluding the nonce.
 * The timestamp is fixed for the lifetime of a nonce search.
 */
struct BlockFields {
  std::string pollId;
  std::string voterHash;
  std::string choice;
  int64_t timestampUs{ 0 };
  std::string prevHash;
};

/**
 * Canonical hash input: pollId | voterHash | choice | timestamp | prevHash |
 * nonce, concatenated without separators. The timestamp is rendered as
 * YYYY-MM-DDTHH:MM:SS.ffffff (UTC) and the nonce as unsigned decimal.
 */
std::string canonicalInput(const BlockFields &fields, uint64_t nonce);

/**
 * SHA-256 of the canonical input as 64 lowercase hex characters
 */
std::string computeHash(const BlockFields &fields, uint64_t nonce);

/**
 * Incremental hasher for nonce search.
 * The digest state of the nonce independent prefix is computed once and
 * copied for every nonce, so each attempt only hashes the nonce digits.
 * Not thread safe; use one instance per worker.
 */
class BlockHasher {
public:
  /**
   * @throws std::runtime_error if OpenSSL cannot set up the digest
   */
  explicit BlockHasher(const BlockFields &fields);
  ~BlockHasher();

  BlockHasher(const BlockHasher &) = delete;
  BlockHasher &operator=(const BlockHasher &) = delete;

  /**
   * Compute the raw digest for a nonce
   * @throws std::runtime_error on OpenSSL failure
   */
  void digest(uint64_t nonce, Digest &out);

  std::string hexDigest(uint64_t nonce);

private:
  EVP_MD_CTX *prefixCtx_{ nullptr };
  EVP_MD_CTX *workCtx_{ nullptr };
};

} // namespace pow
} // namespace hv

#endif // HASHVOTE_BLOCK_HASHER_H
