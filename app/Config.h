#ifndef VNC_LEDGER_CONFIG_H
#define VNC_LEDGER_CONFIG_H

#include "../ledger/Ledger.h"
#include "../lib/Logger.h"
#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace vnc {

/**
 * Settings of the vnc-ledger command line tool, read from
 * <workDir>/config.json:
 *
 *   {
 *     "storageKey": "vnc_blockchain",
 *     "difficulty": 3,
 *     "miningReward": 1,
 *     "verifyOnLoad": false,
 *     "logLevel": "info",
 *     "logFile": ""
 *   }
 *
 * All fields are optional.
 */
struct Config {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const char *FILE_NAME = "config.json";

  Ledger::Config ledger;
  logging::Level logLevel{ logging::Level::INFO };
  std::string logFile;

  nlohmann::json toJson() const;
  static Roe<Config> fromJson(const nlohmann::json &j);

  /**
   * Load <workDir>/config.json, writing one with default values first if it
   * does not exist.
   */
  static Roe<Config> loadOrCreate(const std::string &workDir);
};

} // namespace vnc

#endif // VNC_LEDGER_CONFIG_H
