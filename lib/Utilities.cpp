#include "Utilities.h"

#include <openssl/evp.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hv {
namespace utl {

namespace {

constexpr int64_t MICROS_PER_SECOND = 1000000;

// Floor division so that instants before the epoch format correctly
void splitMicros(int64_t unixMicros, time_t &seconds, int64_t &micros) {
  int64_t s = unixMicros / MICROS_PER_SECOND;
  int64_t us = unixMicros % MICROS_PER_SECOND;
  if (us < 0) {
    us += MICROS_PER_SECOND;
    s -= 1;
  }
  seconds = static_cast<time_t>(s);
  micros = us;
}

bool parseFixedDigits(const std::string &str, size_t pos, size_t count,
                      int &value) {
  if (pos + count > str.size()) {
    return false;
  }
  value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (str[i] < '0' || str[i] > '9') {
      return false;
    }
    value = value * 10 + (str[i] - '0');
  }
  return true;
}

} // namespace

int64_t getCurrentTimeUs() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string formatIsoMicros(int64_t unixMicros) {
  time_t seconds = 0;
  int64_t micros = 0;
  splitMicros(unixMicros, seconds, micros);

  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
     << std::setw(6) << micros;
  return ss.str();
}

Roe<int64_t> parseIsoMicros(const std::string &str) {
  // YYYY-MM-DDTHH:MM:SS
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (str.size() < 19 || str[4] != '-' || str[7] != '-' ||
      (str[10] != 'T' && str[10] != ' ') || str[13] != ':' || str[16] != ':' ||
      !parseFixedDigits(str, 0, 4, year) ||
      !parseFixedDigits(str, 5, 2, month) ||
      !parseFixedDigits(str, 8, 2, day) ||
      !parseFixedDigits(str, 11, 2, hour) ||
      !parseFixedDigits(str, 14, 2, minute) ||
      !parseFixedDigits(str, 17, 2, second)) {
    return Error(1, "Invalid timestamp: " + str);
  }

  size_t pos = 19;
  int64_t micros = 0;
  if (pos < str.size() && str[pos] == '.') {
    ++pos;
    size_t digits = 0;
    while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
      if (digits >= 6) {
        return Error(2, "Timestamp precision exceeds microseconds: " + str);
      }
      micros = micros * 10 + (str[pos] - '0');
      ++pos;
      ++digits;
    }
    if (digits == 0) {
      return Error(1, "Invalid timestamp: " + str);
    }
    for (; digits < 6; ++digits) {
      micros *= 10;
    }
  }
  if (pos < str.size() && str[pos] == 'Z') {
    ++pos;
  }
  if (pos != str.size()) {
    return Error(1, "Invalid timestamp: " + str);
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return Error(3, "Timestamp field out of range: " + str);
  }

  std::tm utc{};
  utc.tm_year = year - 1900;
  utc.tm_mon = month - 1;
  utc.tm_mday = day;
  utc.tm_hour = hour;
  utc.tm_min = minute;
  utc.tm_sec = second;
  time_t seconds = timegm(&utc);
  return static_cast<int64_t>(seconds) * MICROS_PER_SECOND + micros;
}

std::string formatDateUtc(int64_t unixMicros) {
  time_t seconds = 0;
  int64_t micros = 0;
  splitMicros(unixMicros, seconds, micros);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buf[16];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d", &utc) == 0) {
    return std::to_string(unixMicros);
  }
  return std::string(buf);
}

bool startsWith(const std::string &str, const std::string &prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());
  configFile.close();

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return config;
}

std::string sha256(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("SHA-256 digest failed");
  }
  EVP_MD_CTX_free(mdctx);

  return hexEncode(std::string(reinterpret_cast<const char *>(hash), hashLen));
}

std::string deriveVoterHash(const std::string &voterId) {
  return sha256(voterId);
}

std::string hexEncode(const std::string &data) {
  static const char *DIGITS = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (unsigned char c : data) {
    out.push_back(DIGITS[c >> 4]);
    out.push_back(DIGITS[c & 0x0f]);
  }
  return out;
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

bool isLowerHex(const std::string &str, size_t length) {
  if (str.size() != length) {
    return false;
  }
  for (char c : str) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

Roe<void> writeToNewFile(const std::string &filePath,
                         const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(1, "File already exists: " + filePath);
  }

  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }

  std::ofstream file(filePath);
  if (!file.is_open()) {
    return Error(3, "Failed to open file for writing: " + filePath);
  }

  file << content;
  file.close();

  if (!file.good()) {
    return Error(4, "Failed to write content to file: " + filePath);
  }

  return {};
}

} // namespace utl
} // namespace hv
