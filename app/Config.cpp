#include "Config.h"
#include "../lib/Utilities.h"

#include <filesystem>

namespace vnc {

nlohmann::json Config::toJson() const {
  nlohmann::json j;
  j["storageKey"] = ledger.storageKey;
  j["difficulty"] = ledger.difficulty;
  j["miningReward"] = ledger.miningReward;
  j["verifyOnLoad"] = ledger.verifyOnLoad;
  j["logLevel"] = logging::levelToString(logLevel);
  j["logFile"] = logFile;
  return j;
}

Config::Roe<Config> Config::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(1, "Configuration must be a JSON object");
  }

  Config config;

  if (j.contains("storageKey")) {
    if (!j["storageKey"].is_string()) {
      return Error(2, "Configuration field 'storageKey' must be a string");
    }
    config.ledger.storageKey = j["storageKey"].get<std::string>();
    if (!KeyValueStore::isValidKey(config.ledger.storageKey)) {
      return Error(2, "Configuration field 'storageKey' is not a valid key: '" +
                          config.ledger.storageKey + "'");
    }
  }

  if (j.contains("difficulty")) {
    if (!j["difficulty"].is_number_integer()) {
      return Error(3, "Configuration field 'difficulty' must be an integer");
    }
    int64_t difficulty = j["difficulty"].get<int64_t>();
    if (difficulty < Ledger::MIN_DIFFICULTY || difficulty > Ledger::MAX_DIFFICULTY) {
      return Error(3, "Configuration field 'difficulty' must be between " +
                          std::to_string(Ledger::MIN_DIFFICULTY) + " and " +
                          std::to_string(Ledger::MAX_DIFFICULTY));
    }
    config.ledger.difficulty = static_cast<uint32_t>(difficulty);
  }

  if (j.contains("miningReward")) {
    if (!j["miningReward"].is_number()) {
      return Error(4, "Configuration field 'miningReward' must be a number");
    }
    config.ledger.miningReward = j["miningReward"].get<double>();
  }

  if (j.contains("verifyOnLoad")) {
    if (!j["verifyOnLoad"].is_boolean()) {
      return Error(5, "Configuration field 'verifyOnLoad' must be a boolean");
    }
    config.ledger.verifyOnLoad = j["verifyOnLoad"].get<bool>();
  }

  if (j.contains("logLevel")) {
    if (!j["logLevel"].is_string() ||
        !logging::parseLevel(j["logLevel"].get<std::string>(), config.logLevel)) {
      return Error(6, "Configuration field 'logLevel' must be one of debug, info, "
                      "warning, error, critical");
    }
  }

  if (j.contains("logFile")) {
    if (!j["logFile"].is_string()) {
      return Error(7, "Configuration field 'logFile' must be a string");
    }
    config.logFile = j["logFile"].get<std::string>();
  }

  return config;
}

Config::Roe<Config> Config::loadOrCreate(const std::string &workDir) {
  std::filesystem::path configPath = std::filesystem::path(workDir) / FILE_NAME;
  std::error_code ec;

  if (!std::filesystem::exists(configPath, ec)) {
    Config defaults;
    auto written = utl::writeFileAtomic(configPath.string(), defaults.toJson().dump(2) + "\n");
    if (!written) {
      return Error(8, "Failed to create " + configPath.string() + ": " +
                          written.error().message);
    }
    return defaults;
  }

  auto json = utl::loadJsonFile(configPath.string());
  if (!json) {
    return Error(9, json.error().message);
  }
  auto config = fromJson(json.value());
  if (!config) {
    return Error(config.error().code, configPath.string() + ": " + config.error().message);
  }
  return config;
}

} // namespace vnc
