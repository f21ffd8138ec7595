#ifndef VNC_LEDGER_LEDGER_H
#define VNC_LEDGER_LEDGER_H

#include "Block.h"
#include "KeyValueStore.hpp"
#include "MiningJob.h"
#include "Persistence.h"
#include "Transaction.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace vnc {

/**
 * Proof-of-work ledger: the chain of sealed blocks plus the queue of
 * transactions waiting to be mined.
 *
 * Responsibilities:
 * - Accept well-formed transactions into the pending queue
 * - Seal the pending queue into a mined block and pay the miner
 * - Re-verify hashes, links and proof of work of the whole chain
 * - Answer balance queries
 * - Snapshot state to the key-value store after every change
 *
 * Design:
 * - One mutex serializes every public operation (single writer). A running
 *   mine() therefore queues submissions, validations and difficulty changes
 *   until it completes or its cancel flag is raised.
 * - Persistence failures never fail an operation; they are logged and the
 *   in-memory state stays authoritative.
 * - Restored blocks are trusted as stored unless Config::verifyOnLoad is set.
 * - Validation checks every block against the current difficulty, so raising
 *   difficulty can invalidate blocks mined earlier.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_INVALID_TRANSACTION = 1;
  static constexpr int32_t E_INVALID_ARGUMENT = 2;
  static constexpr int32_t E_CANCELLED = 3;
  static constexpr int32_t E_STALE = 4;
  static constexpr int32_t E_HASH = 5;
  static constexpr int32_t E_VALIDATION = 6;
  static constexpr int32_t E_NOT_INITIALIZED = 7;

  static constexpr uint32_t MIN_DIFFICULTY = 1;
  static constexpr uint32_t MAX_DIFFICULTY = 6;
  static constexpr uint32_t DEFAULT_DIFFICULTY = 3;
  static constexpr double DEFAULT_MINING_REWARD = 1;
  static constexpr const char *DEFAULT_STORAGE_KEY = "vnc_blockchain";

  struct Config {
    std::string storageKey{ DEFAULT_STORAGE_KEY };
    uint32_t difficulty{ DEFAULT_DIFFICULTY };
    double miningReward{ DEFAULT_MINING_REWARD };
    bool verifyOnLoad{ false };
  };

  /**
   * @param store Backing store; must outlive the ledger
   */
  explicit Ledger(KeyValueStore &store);
  ~Ledger() override = default;

  /**
   * Validate config and restore state from the store.
   * Missing or unreadable state starts a fresh chain with a genesis block.
   */
  Roe<void> init(const Config &config);

  // ----------------- operations -------------------------------------

  /**
   * Queue a transaction.
   * @return E_INVALID_TRANSACTION if from/to is empty or not UTF-8, or amount is
   *         not finite
   */
  Roe<void> submit(const Transaction &tx);

  /**
   * Mine the pending queue into a new block appended to the chain.
   * The pending queue is replaced by the miner's reward transaction.
   * @param minerAddress Reward recipient
   * @param cancel Optional flag, read once per nonce attempt
   * @return Sealed block, or E_CANCELLED when the flag was raised
   */
  Roe<Block> mine(const std::string &minerAddress,
                  const std::atomic<bool> *cancel = nullptr);

  /**
   * Snapshot a candidate block for externally driven mining.
   * Drive the job with MiningJob::step() and hand it to commitMined().
   */
  Roe<MiningJob> beginMining(const std::string &minerAddress) const;

  /**
   * Append the block of a FOUND job and pay its miner.
   * Transactions queued after the job's snapshot stay pending behind the
   * reward.
   * @return E_STALE if the tip, difficulty or pending queue moved on
   */
  Roe<Block> commitMined(const MiningJob &job);

  /** True if every non-genesis block passes hash, link and difficulty checks */
  bool isValid() const;

  /** Like isValid(), reporting the first failing block and why */
  Roe<void> validate() const;

  double balanceOf(const std::string &address) const;

  /** Balance of every known address, in first-seen order */
  std::vector<std::pair<std::string, double>> balances() const;

  /** Drop the stored state and restart from a fresh genesis block */
  Roe<void> reset();

  // ----------------- accessors -------------------------------------
  std::vector<Block> getChain() const;
  std::vector<Transaction> getPendingTransactions() const;
  Block getLatestBlock() const;
  size_t getSize() const;
  uint32_t getDifficulty() const;
  double getMiningReward() const;

  Roe<void> setDifficulty(uint32_t difficulty);
  Roe<void> setMiningReward(double reward);

  /** Clamp a requested difficulty into [MIN_DIFFICULTY, MAX_DIFFICULTY] */
  static uint32_t clampDifficulty(int64_t difficulty);

  /**
   * Check a chain against a difficulty. The first block is not verified.
   */
  static Roe<void> validateChain(const std::vector<Block> &chain, uint32_t difficulty);

private:
  Roe<void> checkInitialized() const;
  void restore();
  void createGenesisBlock();
  void persist();
  Block appendMined(const Block &block, const std::string &minerAddress,
                    size_t nIncluded);

  mutable std::mutex mutex_;
  KeyValueStore &store_;
  std::unique_ptr<Persistence> persistence_;
  bool verifyOnLoad_{ false };

  std::vector<Block> chain_;
  std::vector<Transaction> pending_;
  uint32_t difficulty_{ DEFAULT_DIFFICULTY };
  double miningReward_{ DEFAULT_MINING_REWARD };
};

} // namespace vnc

#endif // VNC_LEDGER_LEDGER_H
