#ifndef VNC_LEDGER_BLOCK_H
#define VNC_LEDGER_BLOCK_H

#include "Transaction.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vnc {

/**
 * A block of transactions linked to its predecessor by hash.
 *
 * Nonce and hash are written while mining; once a block is appended to a
 * chain it is treated as immutable. The genesis block carries hash "0" and
 * is exempt from proof of work.
 */
class Block {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const char *GENESIS_HASH = "0";

  Block() = default;
  Block(int64_t timestamp, std::vector<Transaction> transactions,
        std::string previousHash);

  /**
   * Build the genesis sentinel
   * @param timestamp Creation time in epoch milliseconds
   */
  static Block genesis(int64_t timestamp);

  int64_t getTimestamp() const { return timestamp_; }
  const std::vector<Transaction> &getTransactions() const { return transactions_; }
  const std::string &getPreviousHash() const { return previousHash_; }
  uint64_t getNonce() const { return nonce_; }
  const std::string &getHash() const { return hash_; }

  void setNonce(uint64_t nonce) { nonce_ = nonce; }
  void setHash(const std::string &hash) { hash_ = hash; }

  // Mutable access for tests that tamper with sealed blocks
  std::vector<Transaction> &mutableTransactions() { return transactions_; }
  void setTimestamp(int64_t timestamp) { timestamp_ = timestamp; }
  void setPreviousHash(const std::string &hash) { previousHash_ = hash; }

  /**
   * Canonical hash input:
   *   previousHash "|" timestamp "|" transactions-as-json "|" nonce
   * Transactions keep insertion order.
   */
  std::string computeFingerprint() const;

  /**
   * Hash of the current fingerprint
   * @throws std::runtime_error if hashing fails
   */
  std::string calculateHash() const;

  /**
   * Check the stored hash starts with `difficulty` '0' hex digits
   */
  bool meetsDifficulty(uint32_t difficulty) const;

  nlohmann::json toJson() const;

  /**
   * Restore a block record. Nonce and hash are taken verbatim, not recomputed.
   */
  static Roe<Block> fromJson(const nlohmann::json &j);

  bool operator==(const Block &other) const;
  bool operator!=(const Block &other) const { return !(*this == other); }

private:
  int64_t timestamp_{ 0 };
  std::vector<Transaction> transactions_;
  std::string previousHash_;
  uint64_t nonce_{ 0 };
  std::string hash_;
};

/**
 * Check a hash starts with `difficulty` '0' characters
 */
bool hasLeadingZeros(const std::string &hash, uint32_t difficulty);

} // namespace vnc

#endif // VNC_LEDGER_BLOCK_H
