#ifndef VNC_LEDGER_MINING_JOB_H
#define VNC_LEDGER_MINING_JOB_H

#include "Block.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace vnc {

/**
 * Proof-of-work search for one candidate block.
 *
 * The search is an explicit state machine so it can be driven in slices by
 * an outer loop and abandoned at any attempt boundary:
 *
 *   SEARCHING(nonce) --hash meets target--> FOUND
 *   SEARCHING(nonce) --cancel requested---> CANCELLED
 *
 * FOUND and CANCELLED are terminal.
 */
class MiningJob {
public:
  enum class State { SEARCHING, FOUND, CANCELLED };

  /**
   * @param candidate Block to seal; its nonce is reset to 0
   * @param difficulty Required number of leading '0' hex digits
   * @param minerAddress Reward recipient once the block is committed
   */
  MiningJob(Block candidate, uint32_t difficulty, std::string minerAddress);

  /**
   * Try at most maxAttempts nonces.
   * The cancel flag (optional) is read once before every attempt.
   * @return State after the slice
   * @throws std::runtime_error if hashing fails
   */
  State step(uint64_t maxAttempts, const std::atomic<bool> *cancel = nullptr);

  /**
   * Search until FOUND or CANCELLED
   * @throws std::runtime_error if hashing fails
   */
  State run(const std::atomic<bool> *cancel = nullptr);

  /** Move to CANCELLED unless already FOUND */
  void cancel();

  State getState() const { return state_; }
  bool isDone() const { return state_ != State::SEARCHING; }

  /** Nonce to be tried next while SEARCHING; the winning nonce once FOUND */
  uint64_t getNonce() const { return block_.getNonce(); }
  uint64_t getAttempts() const { return attempts_; }
  uint32_t getDifficulty() const { return difficulty_; }
  const std::string &getMinerAddress() const { return minerAddress_; }
  const Block &getBlock() const { return block_; }

private:
  Block block_;
  uint32_t difficulty_{ 0 };
  std::string minerAddress_;
  State state_{ State::SEARCHING };
  uint64_t attempts_{ 0 };
};

const char *toString(MiningJob::State state);

} // namespace vnc

#endif // VNC_LEDGER_MINING_JOB_H
