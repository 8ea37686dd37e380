#ifndef HASHVOTE_CONFIG_H
#define HASHVOTE_CONFIG_H

#include "DifficultyPolicy.h"
#include "../lib/Logger.h"
#include "../lib/ResultOrError.hpp"
#include "../pow/NonceSearcher.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace hv {

/**
 * Contents of config.json in the work directory
 */
struct RunFileConfig {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_IO = 2;

  constexpr static const char *FILE_CONFIG = "config.json";
  constexpr static const char *DEFAULT_LEDGER_FILE = "ledger.dat";

  struct SearchConfig {
    uint32_t timeoutSeconds{ 30 };
    uint32_t workers{ 1 };
    uint32_t maxAttempts{ 3 };
  };

  std::string ledgerFile{ DEFAULT_LEDGER_FILE };
  std::string logLevel{ "INFO" };
  DifficultyPolicy::Config difficulty;
  SearchConfig search;

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);

  pow::NonceSearcher::Config searcherConfig() const;

  /**
   * Load config.json from workDir, writing the defaults there first if the
   * file does not exist yet
   */
  static Roe<RunFileConfig> loadOrCreate(const std::string &workDir,
                                         logging::Logger &logger);
};

} // namespace hv

#endif // HASHVOTE_CONFIG_H
