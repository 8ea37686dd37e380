#include "Config.h"
#include "../lib/Utilities.h"
#include "../pow/Difficulty.h"

#include <filesystem>

namespace hv {

namespace {

RunFileConfig::Roe<uint32_t> readPositive(const nlohmann::json &jd,
                                          const std::string &field,
                                          uint32_t current) {
  if (!jd.contains(field)) {
    return current;
  }
  if (!jd[field].is_number_unsigned()) {
    return RunFileConfig::Error(RunFileConfig::E_CONFIG,
                                "Field '" + field +
                                    "' must be a positive number");
  }
  uint64_t value = jd[field].get<uint64_t>();
  if (value == 0 || value > UINT32_MAX) {
    return RunFileConfig::Error(RunFileConfig::E_CONFIG,
                                "Field '" + field + "' is out of range");
  }
  return static_cast<uint32_t>(value);
}

RunFileConfig::Roe<int> readBits(const nlohmann::json &jd,
                                 const std::string &field, int current) {
  if (!jd.contains(field)) {
    return current;
  }
  if (!jd[field].is_number_integer()) {
    return RunFileConfig::Error(RunFileConfig::E_CONFIG,
                                "Field '" + field + "' must be an integer");
  }
  int64_t value = jd[field].get<int64_t>();
  if (value < pow::MIN_BITS || value > pow::MAX_BITS) {
    return RunFileConfig::Error(RunFileConfig::E_CONFIG,
                                "Field '" + field +
                                    "' must be between 0 and 256");
  }
  return static_cast<int>(value);
}

} // namespace

nlohmann::json RunFileConfig::ltsToJson() const {
  nlohmann::json j;
  j["ledgerFile"] = ledgerFile;
  j["logLevel"] = logLevel;
  j["difficulty"]["defaultBits"] = difficulty.defaultBits;
  j["difficulty"]["reducedBits"] = difficulty.reducedBits;
  j["difficulty"]["lowStakesPrefixes"] = difficulty.lowStakesPrefixes;
  j["search"]["timeoutSeconds"] = search.timeoutSeconds;
  j["search"]["workers"] = search.workers;
  j["search"]["maxAttempts"] = search.maxAttempts;
  return j;
}

RunFileConfig::Roe<void> RunFileConfig::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    if (jd.contains("ledgerFile")) {
      if (!jd["ledgerFile"].is_string()) {
        return Error(E_CONFIG, "Field 'ledgerFile' must be a string");
      }
      ledgerFile = jd["ledgerFile"].get<std::string>();
      if (ledgerFile.empty()) {
        return Error(E_CONFIG, "Field 'ledgerFile' cannot be empty");
      }
    }

    if (jd.contains("logLevel")) {
      if (!jd["logLevel"].is_string()) {
        return Error(E_CONFIG, "Field 'logLevel' must be a string");
      }
      logLevel = jd["logLevel"].get<std::string>();
      logging::Level level;
      if (!logging::parseLevel(logLevel, level)) {
        return Error(E_CONFIG, "Unknown log level: " + logLevel);
      }
    }

    if (jd.contains("difficulty")) {
      const auto &jDifficulty = jd["difficulty"];
      if (!jDifficulty.is_object()) {
        return Error(E_CONFIG, "Field 'difficulty' must be an object");
      }
      auto defaultBits =
          readBits(jDifficulty, "defaultBits", difficulty.defaultBits);
      if (!defaultBits) {
        return defaultBits.error();
      }
      auto reducedBits =
          readBits(jDifficulty, "reducedBits", difficulty.reducedBits);
      if (!reducedBits) {
        return reducedBits.error();
      }
      difficulty.defaultBits = defaultBits.value();
      difficulty.reducedBits = reducedBits.value();

      if (jDifficulty.contains("lowStakesPrefixes")) {
        const auto &jPrefixes = jDifficulty["lowStakesPrefixes"];
        if (!jPrefixes.is_array()) {
          return Error(E_CONFIG,
                       "Field 'lowStakesPrefixes' must be an array");
        }
        difficulty.lowStakesPrefixes.clear();
        for (const auto &jPrefix : jPrefixes) {
          if (!jPrefix.is_string() || jPrefix.get<std::string>().empty()) {
            return Error(E_CONFIG, "Low stakes prefixes must be non-empty "
                                   "strings");
          }
          difficulty.lowStakesPrefixes.push_back(jPrefix.get<std::string>());
        }
      }
    }

    if (jd.contains("search")) {
      const auto &jSearch = jd["search"];
      if (!jSearch.is_object()) {
        return Error(E_CONFIG, "Field 'search' must be an object");
      }
      auto timeout =
          readPositive(jSearch, "timeoutSeconds", search.timeoutSeconds);
      if (!timeout) {
        return timeout.error();
      }
      auto workers = readPositive(jSearch, "workers", search.workers);
      if (!workers) {
        return workers.error();
      }
      auto attempts = readPositive(jSearch, "maxAttempts", search.maxAttempts);
      if (!attempts) {
        return attempts.error();
      }
      search.timeoutSeconds = timeout.value();
      search.workers = workers.value();
      search.maxAttempts = attempts.value();
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG,
                 "Failed to parse configuration: " + std::string(e.what()));
  }
}

pow::NonceSearcher::Config RunFileConfig::searcherConfig() const {
  pow::NonceSearcher::Config config;
  config.workers = search.workers;
  return config;
}

RunFileConfig::Roe<RunFileConfig>
RunFileConfig::loadOrCreate(const std::string &workDir,
                            logging::Logger &logger) {
  std::filesystem::path configPath =
      std::filesystem::path(workDir) / FILE_CONFIG;
  RunFileConfig config;

  if (!std::filesystem::exists(configPath)) {
    logger.info << "No " << FILE_CONFIG << " found, creating with defaults";
    auto written =
        utl::writeToNewFile(configPath.string(), config.ltsToJson().dump(2));
    if (!written) {
      return Error(E_IO, "Failed to create " + configPath.string() + ": " +
                             written.error().message);
    }
    logger.info << "Created " << configPath.string();
    return config;
  }

  auto jsonResult = utl::loadJsonFile(configPath.string());
  if (!jsonResult) {
    return Error(E_CONFIG,
                 "Failed to load config file: " + jsonResult.error().message);
  }
  auto parsed = config.ltsFromJson(jsonResult.value());
  if (!parsed) {
    return Error(E_CONFIG,
                 "Failed to parse config file: " + parsed.error().message);
  }
  logger.debug << "Loaded " << configPath.string();
  return config;
}

} // namespace hv
