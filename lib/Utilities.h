#ifndef HASHVOTE_UTILITIES_H
#define HASHVOTE_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hv {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current wall clock time in microseconds since the epoch (UTC)
 */
int64_t getCurrentTimeUs();

/**
 * Format microseconds since the epoch as "YYYY-MM-DDTHH:MM:SS.ffffff" (UTC).
 * The fractional part always has six digits.
 */
std::string formatIsoMicros(int64_t unixMicros);

/**
 * Parse the format produced by formatIsoMicros. A trailing "Z" and a
 * fractional part of fewer than six digits are accepted.
 * @return Roe<int64_t> microseconds since the epoch, or error
 */
Roe<int64_t> parseIsoMicros(const std::string &str);

/**
 * Format microseconds since the epoch as a UTC date, e.g. "2024-05-01"
 */
std::string formatDateUtc(int64_t unixMicros);

bool startsWith(const std::string &str, const std::string &prefix);

/**
 * Load and parse a JSON file
 * @param configPath Path to the JSON file
 * @return Roe<nlohmann::json> with the parsed document or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Compute SHA-256 of the input using the OpenSSL EVP API
 * @return 64 lowercase hex characters
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string sha256(const std::string &input);

/**
 * Derive the voter hash for a raw voter identifier (SHA-256 hex)
 */
std::string deriveVoterHash(const std::string &voterId);

/**
 * Encode binary data as a lowercase hex string
 */
std::string hexEncode(const std::string &data);

/**
 * Decode a hex string back to binary
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

/**
 * Check whether a string is exactly `length` lowercase hex characters
 */
bool isLowerHex(const std::string &str, size_t length);

/**
 * Write a string to a file that must not exist yet.
 * Creates parent directories if needed.
 */
Roe<void> writeToNewFile(const std::string &filePath,
                         const std::string &content);

} // namespace utl
} // namespace hv

#endif // HASHVOTE_UTILITIES_H
