#include "Ledger.h"
#include "Balance.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace vnc {

Ledger::Ledger(KeyValueStore &store) : Module("vnc.ledger"), store_(store) {}

Ledger::Roe<void> Ledger::init(const Config &config) {
  if (config.difficulty < MIN_DIFFICULTY || config.difficulty > MAX_DIFFICULTY) {
    return Error(E_INVALID_ARGUMENT, "Difficulty must be between " +
                                         std::to_string(MIN_DIFFICULTY) + " and " +
                                         std::to_string(MAX_DIFFICULTY) + ", got " +
                                         std::to_string(config.difficulty));
  }
  if (!std::isfinite(config.miningReward)) {
    return Error(E_INVALID_ARGUMENT, "Mining reward must be a finite number");
  }
  if (!KeyValueStore::isValidKey(config.storageKey)) {
    return Error(E_INVALID_ARGUMENT, "Invalid storage key: '" + config.storageKey + "'");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  persistence_ = std::make_unique<Persistence>(store_, config.storageKey);
  verifyOnLoad_ = config.verifyOnLoad;
  difficulty_ = config.difficulty;
  miningReward_ = config.miningReward;
  chain_.clear();
  pending_.clear();

  restore();

  log().info << "Ledger initialized: key=" << config.storageKey
             << ", blocks=" << chain_.size() << ", pending=" << pending_.size()
             << ", difficulty=" << difficulty_;
  return {};
}

Ledger::Roe<void> Ledger::checkInitialized() const {
  if (!persistence_) {
    return Error(E_NOT_INITIALIZED, "Ledger is not initialized");
  }
  return {};
}

void Ledger::restore() {
  auto loaded = persistence_->load();
  if (!loaded) {
    if (loaded.error().code == Persistence::E_NOT_FOUND) {
      log().info << "No saved state, starting a new chain";
    } else {
      log().warning << "Failed loading chain: " << loaded.error().message;
    }
  } else {
    chain_ = std::move(loaded->chain);
    pending_ = std::move(loaded->pending);

    if (verifyOnLoad_ && !chain_.empty()) {
      auto valid = validateChain(chain_, difficulty_);
      if (!valid) {
        log().warning << "Discarding restored chain: " << valid.error().message;
        chain_.clear();
        pending_.clear();
      }
    }
  }

  if (chain_.empty()) {
    createGenesisBlock();
  }
}

void Ledger::createGenesisBlock() {
  chain_.push_back(Block::genesis(utl::getCurrentTimeMillis()));
  log().debug << "Created genesis block";
  persist();
}

void Ledger::persist() {
  auto result = persistence_->save(chain_, pending_);
  if (!result) {
    log().warning << "Failed saving chain: " << result.error().message;
  }
}

Ledger::Roe<void> Ledger::submit(const Transaction &tx) {
  auto valid = tx.validate();
  if (!valid) {
    return Error(E_INVALID_TRANSACTION, valid.error().message);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto initialized = checkInitialized();
  if (!initialized) {
    return initialized;
  }

  pending_.push_back(tx);
  log().debug << "Queued transaction " << tx << " (pending=" << pending_.size() << ")";
  persist();
  return {};
}

Ledger::Roe<Block> Ledger::mine(const std::string &minerAddress,
                                const std::atomic<bool> *cancel) {
  if (minerAddress.empty()) {
    return Error(E_INVALID_ARGUMENT, "Miner address must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto initialized = checkInitialized();
  if (!initialized) {
    return initialized.error();
  }

  Block candidate(utl::getCurrentTimeMillis(), pending_, chain_.back().getHash());
  MiningJob job(std::move(candidate), difficulty_, minerAddress);

  log().info << "Mining block " << chain_.size() << " with " << pending_.size()
             << " transactions at difficulty " << difficulty_;
  try {
    job.run(cancel);
  } catch (const std::exception &e) {
    return Error(E_HASH, "Mining failed: " + std::string(e.what()));
  }

  if (job.getState() != MiningJob::State::FOUND) {
    log().info << "Mining cancelled after " << job.getAttempts() << " attempts";
    return Error(E_CANCELLED, "Mining cancelled");
  }

  log().info << "Mined block " << chain_.size() << " (nonce=" << job.getNonce()
             << ", attempts=" << job.getAttempts() << ")";
  return appendMined(job.getBlock(), minerAddress, pending_.size());
}

Ledger::Roe<MiningJob> Ledger::beginMining(const std::string &minerAddress) const {
  if (minerAddress.empty()) {
    return Error(E_INVALID_ARGUMENT, "Miner address must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto initialized = checkInitialized();
  if (!initialized) {
    return initialized.error();
  }

  Block candidate(utl::getCurrentTimeMillis(), pending_, chain_.back().getHash());
  return MiningJob(std::move(candidate), difficulty_, minerAddress);
}

Ledger::Roe<Block> Ledger::commitMined(const MiningJob &job) {
  if (job.getState() != MiningJob::State::FOUND) {
    return Error(E_INVALID_ARGUMENT, std::string("Mining job is not finished (") +
                                         toString(job.getState()) + ")");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto initialized = checkInitialized();
  if (!initialized) {
    return initialized.error();
  }

  const Block &block = job.getBlock();
  if (block.getPreviousHash() != chain_.back().getHash()) {
    return Error(E_STALE, "Chain tip changed while mining");
  }
  if (job.getDifficulty() != difficulty_) {
    return Error(E_STALE, "Difficulty changed while mining (mined at " +
                              std::to_string(job.getDifficulty()) + ", now " +
                              std::to_string(difficulty_) + ")");
  }

  const auto &included = block.getTransactions();
  if (included.size() > pending_.size() ||
      !std::equal(included.begin(), included.end(), pending_.begin())) {
    return Error(E_STALE, "Pending transactions changed while mining");
  }

  log().info << "Committing mined block " << chain_.size() << " (nonce="
             << job.getNonce() << ", attempts=" << job.getAttempts() << ")";
  return appendMined(block, job.getMinerAddress(), included.size());
}

Block Ledger::appendMined(const Block &block, const std::string &minerAddress,
                          size_t nIncluded) {
  chain_.push_back(block);

  std::vector<Transaction> pending;
  pending.emplace_back(Transaction::NETWORK_ADDRESS, minerAddress, miningReward_);
  pending.insert(pending.end(), pending_.begin() + static_cast<std::ptrdiff_t>(nIncluded),
                 pending_.end());
  pending_ = std::move(pending);

  persist();
  return block;
}

Ledger::Roe<void> Ledger::validateChain(const std::vector<Block> &chain, uint32_t difficulty) {
  if (chain.empty()) {
    return Error(E_VALIDATION, "Chain is empty");
  }

  for (size_t i = 1; i < chain.size(); i++) {
    const Block &current = chain[i];
    const Block &previous = chain[i - 1];

    std::string expectedHash;
    try {
      expectedHash = current.calculateHash();
    } catch (const std::exception &e) {
      return Error(E_HASH, "Block " + std::to_string(i) + ": " + e.what());
    }

    if (current.getHash() != expectedHash) {
      return Error(E_VALIDATION, "Block " + std::to_string(i) + ": hash mismatch");
    }
    if (current.getPreviousHash() != previous.getHash()) {
      return Error(E_VALIDATION, "Block " + std::to_string(i) +
                                     ": previous hash does not match block " +
                                     std::to_string(i - 1));
    }
    if (!current.meetsDifficulty(difficulty)) {
      return Error(E_VALIDATION, "Block " + std::to_string(i) +
                                     ": hash does not meet difficulty " +
                                     std::to_string(difficulty));
    }
  }
  return {};
}

Ledger::Roe<void> Ledger::validate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto initialized = checkInitialized();
  if (!initialized) {
    return initialized;
  }
  return validateChain(chain_, difficulty_);
}

bool Ledger::isValid() const {
  auto result = validate();
  if (!result) {
    log().debug << "Chain validation failed: " << result.error().message;
    return false;
  }
  return true;
}

double Ledger::balanceOf(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return vnc::balanceOf(address, chain_, pending_);
}

std::vector<std::pair<std::string, double>> Ledger::balances() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<std::string, double>> result;
  for (const auto &address : collectAddresses(chain_, pending_)) {
    result.emplace_back(address, vnc::balanceOf(address, chain_, pending_));
  }
  return result;
}

Ledger::Roe<void> Ledger::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto initialized = checkInitialized();
  if (!initialized) {
    return initialized;
  }

  auto removed = persistence_->remove();
  if (!removed) {
    log().warning << "Failed removing saved chain: " << removed.error().message;
  }
  chain_.clear();
  pending_.clear();
  createGenesisBlock();
  log().info << "Ledger reset";
  return {};
}

std::vector<Block> Ledger::getChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_;
}

std::vector<Transaction> Ledger::getPendingTransactions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

Block Ledger::getLatestBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (chain_.empty()) {
    return Block();
  }
  return chain_.back();
}

size_t Ledger::getSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.size();
}

uint32_t Ledger::getDifficulty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return difficulty_;
}

double Ledger::getMiningReward() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return miningReward_;
}

Ledger::Roe<void> Ledger::setDifficulty(uint32_t difficulty) {
  if (difficulty < MIN_DIFFICULTY || difficulty > MAX_DIFFICULTY) {
    return Error(E_INVALID_ARGUMENT, "Difficulty must be between " +
                                         std::to_string(MIN_DIFFICULTY) + " and " +
                                         std::to_string(MAX_DIFFICULTY));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  difficulty_ = difficulty;
  return {};
}

Ledger::Roe<void> Ledger::setMiningReward(double reward) {
  if (!std::isfinite(reward)) {
    return Error(E_INVALID_ARGUMENT, "Mining reward must be a finite number");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  miningReward_ = reward;
  return {};
}

uint32_t Ledger::clampDifficulty(int64_t difficulty) {
  return static_cast<uint32_t>(std::max<int64_t>(
      MIN_DIFFICULTY, std::min<int64_t>(MAX_DIFFICULTY, difficulty)));
}

} // namespace vnc
