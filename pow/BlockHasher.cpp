#include "BlockHasher.h"
#include "../lib/Utilities.h"

#include <openssl/evp.h>

#include <charconv>
#include <stdexcept>

namespace hv {
namespace pow {

const std::string GENESIS_HASH(64, '0');

namespace {

std::string prefixOf(const BlockFields &fields) {
  std::string prefix;
  prefix.reserve(fields.pollId.size() + fields.voterHash.size() +
                 fields.choice.size() + 26 + fields.prevHash.size());
  prefix += fields.pollId;
  prefix += fields.voterHash;
  prefix += fields.choice;
  prefix += utl::formatIsoMicros(fields.timestampUs);
  prefix += fields.prevHash;
  return prefix;
}

} // namespace

std::string canonicalInput(const BlockFields &fields, uint64_t nonce) {
  return prefixOf(fields) + std::to_string(nonce);
}

std::string computeHash(const BlockFields &fields, uint64_t nonce) {
  return utl::sha256(canonicalInput(fields, nonce));
}

BlockHasher::BlockHasher(const BlockFields &fields) {
  prefixCtx_ = EVP_MD_CTX_new();
  workCtx_ = EVP_MD_CTX_new();
  if (!prefixCtx_ || !workCtx_) {
    EVP_MD_CTX_free(prefixCtx_);
    EVP_MD_CTX_free(workCtx_);
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  std::string prefix = prefixOf(fields);
  if (EVP_DigestInit_ex(prefixCtx_, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(prefixCtx_, prefix.data(), prefix.size()) != 1) {
    EVP_MD_CTX_free(prefixCtx_);
    EVP_MD_CTX_free(workCtx_);
    throw std::runtime_error("Failed to initialize SHA-256 digest");
  }
}

BlockHasher::~BlockHasher() {
  EVP_MD_CTX_free(prefixCtx_);
  EVP_MD_CTX_free(workCtx_);
}

void BlockHasher::digest(uint64_t nonce, Digest &out) {
  char digits[20];
  auto [end, ec] = std::to_chars(digits, digits + sizeof(digits), nonce);
  unsigned int len = 0;
  if (ec != std::errc{} || EVP_MD_CTX_copy_ex(workCtx_, prefixCtx_) != 1 ||
      EVP_DigestUpdate(workCtx_, digits, end - digits) != 1 ||
      EVP_DigestFinal_ex(workCtx_, out.data(), &len) != 1 ||
      len != DIGEST_SIZE) {
    throw std::runtime_error("SHA-256 digest failed");
  }
}

std::string BlockHasher::hexDigest(uint64_t nonce) {
  Digest raw;
  digest(nonce, raw);
  return utl::hexEncode(
      std::string(reinterpret_cast<const char *>(raw.data()), raw.size()));
}

} // namespace pow
} // namespace hv
