#include "Config.h"
#include "../ledger/FileKvStore.h"
#include "../ledger/Ledger.h"
#include "../lib/Logger.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

constexpr const char *DIR_DATA = "data";

std::atomic<bool> g_cancelMining{false};

void signalHandler(int signal) {
  if (signal == SIGINT) {
    g_cancelMining = true;
  }
}

int runSubmit(vnc::Ledger &ledger, const std::string &from, const std::string &to,
              double amount) {
  auto result = ledger.submit(vnc::Transaction(from, to, amount));
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  std::cout << "Transaction queued (" << ledger.getPendingTransactions().size()
            << " pending)\n";
  return 0;
}

// Difficulty given on the command line applies to this run only
bool applyDifficulty(vnc::Ledger &ledger, const CLI::Option *option, int difficulty) {
  if (option->count() == 0) {
    return true;
  }
  auto set = ledger.setDifficulty(vnc::Ledger::clampDifficulty(difficulty));
  if (!set) {
    std::cerr << "Error: " << set.error().message << "\n";
    return false;
  }
  return true;
}

int runMine(vnc::Ledger &ledger, const std::string &minerAddress,
            const CLI::Option *difficultyOption, int difficulty) {
  if (!applyDifficulty(ledger, difficultyOption, difficulty)) {
    return 1;
  }

  std::signal(SIGINT, signalHandler);
  std::cout << "Mining at difficulty " << ledger.getDifficulty()
            << "... (Ctrl+C to cancel)\n";
  auto result = ledger.mine(minerAddress, &g_cancelMining);
  std::signal(SIGINT, SIG_DFL);

  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return result.error().code == vnc::Ledger::E_CANCELLED ? 130 : 1;
  }
  std::cout << "Mined block " << ledger.getSize() - 1 << " (nonce=" << result->getNonce()
            << ")\n";
  std::cout << "Hash: " << result->getHash() << "\n";
  return 0;
}

int runValidate(vnc::Ledger &ledger, const CLI::Option *difficultyOption, int difficulty) {
  if (!applyDifficulty(ledger, difficultyOption, difficulty)) {
    return 1;
  }
  auto result = ledger.validate();
  if (!result) {
    std::cout << "Chain is INVALID: " << result.error().message << "\n";
    return 2;
  }
  std::cout << "Chain is valid (" << ledger.getSize() << " blocks, difficulty "
            << ledger.getDifficulty() << ")\n";
  return 0;
}

int runBalances(vnc::Ledger &ledger) {
  auto balances = ledger.balances();
  if (balances.empty()) {
    std::cout << "(none)\n";
    return 0;
  }
  for (const auto &entry : balances) {
    std::cout << entry.first << " : " << entry.second << "\n";
  }
  return 0;
}

int runPending(vnc::Ledger &ledger) {
  auto pending = ledger.getPendingTransactions();
  if (pending.empty()) {
    std::cout << "No pending transactions\n";
    return 0;
  }
  for (size_t i = 0; i < pending.size(); i++) {
    std::cout << (i + 1) << ". " << pending[i] << "\n";
  }
  return 0;
}

int runShow(vnc::Ledger &ledger) {
  nlohmann::json chain = nlohmann::json::array();
  for (const auto &block : ledger.getChain()) {
    chain.push_back(block.toJson());
  }
  std::cout << chain.dump(2) << "\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"vnc-ledger - local proof-of-work transaction ledger"};
  app.require_subcommand(1);

  std::string workDir = ".vnc-ledger";
  app.add_option("-d,--work-dir", workDir, "Work directory (config.json and data/)")
      ->capture_default_str();

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  auto *submit_cmd = app.add_subcommand("submit", "Queue a transaction");
  std::string from, to;
  double amount = 0;
  submit_cmd->add_option("from", from, "Sender address")->required();
  submit_cmd->add_option("to", to, "Recipient address")->required();
  submit_cmd->add_option("amount", amount, "Amount to transfer")->required();

  auto *mine_cmd = app.add_subcommand("mine", "Mine pending transactions into a block");
  std::string minerAddress;
  int difficulty = 0;
  mine_cmd->add_option("miner", minerAddress, "Reward address")->required();
  auto *mine_difficulty = mine_cmd->add_option(
      "--difficulty", difficulty, "Leading zero hex digits required (clamped to 1-6)");

  auto *validate_cmd = app.add_subcommand("validate", "Verify every block of the chain");
  auto *validate_difficulty = validate_cmd->add_option(
      "--difficulty", difficulty, "Validate against this difficulty (clamped to 1-6)");

  auto *balance_cmd = app.add_subcommand("balance", "Show the balance of an address");
  std::string address;
  balance_cmd->add_option("address", address, "Address")->required();

  auto *balances_cmd = app.add_subcommand("balances", "Show the balance of every known address");
  auto *pending_cmd = app.add_subcommand("pending", "List pending transactions");
  auto *show_cmd = app.add_subcommand("show", "Print the chain as JSON");
  auto *reset_cmd = app.add_subcommand("reset", "Delete the chain and start from genesis");

  CLI11_PARSE(app, argc, argv);

  auto configResult = vnc::Config::loadOrCreate(workDir);
  if (!configResult) {
    std::cerr << "Error: " << configResult.error().message << "\n";
    return 1;
  }
  const vnc::Config &config = configResult.value();

  auto rootLogger = vnc::logging::getRootLogger();
  rootLogger->setLevel(debug ? vnc::logging::Level::DEBUG : config.logLevel);
  if (!config.logFile.empty()) {
    try {
      rootLogger->addFileHandler(config.logFile, vnc::logging::Level::DEBUG);
    } catch (const std::exception &e) {
      std::cerr << "Warning: " << e.what() << "\n";
    }
  }

  vnc::FileKvStore store((std::filesystem::path(workDir) / DIR_DATA).string());
  vnc::Ledger ledger(store);
  auto initResult = ledger.init(config.ledger);
  if (!initResult) {
    std::cerr << "Error: " << initResult.error().message << "\n";
    return 1;
  }

  if (*submit_cmd) {
    return runSubmit(ledger, from, to, amount);
  }
  if (*mine_cmd) {
    return runMine(ledger, minerAddress, mine_difficulty, difficulty);
  }
  if (*validate_cmd) {
    return runValidate(ledger, validate_difficulty, difficulty);
  }
  if (*balance_cmd) {
    std::cout << address << " : " << ledger.balanceOf(address) << "\n";
    return 0;
  }
  if (*balances_cmd) {
    return runBalances(ledger);
  }
  if (*pending_cmd) {
    return runPending(ledger);
  }
  if (*show_cmd) {
    return runShow(ledger);
  }
  if (*reset_cmd) {
    auto result = ledger.reset();
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
    std::cout << "Chain reset\n";
    return 0;
  }
  return 0;
}
