#ifndef VNC_LEDGER_PERSISTENCE_H
#define VNC_LEDGER_PERSISTENCE_H

#include "Block.h"
#include "KeyValueStore.hpp"
#include "Transaction.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <string>
#include <vector>

namespace vnc {

/**
 * Snapshots ledger state into a key-value store.
 *
 * Blob layout (JSON, unversioned):
 *   { "chain":   [ {timestamp, transactions, previousHash, nonce, hash}, ... ],
 *     "pending": [ {from, to, amount}, ... ] }
 */
class Persistence : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_NOT_FOUND = 1;
  static constexpr int32_t E_IO = 2;
  static constexpr int32_t E_PARSE = 3;
  static constexpr int32_t E_FORMAT = 4;

  struct State {
    std::vector<Block> chain;
    std::vector<Transaction> pending;
  };

  /**
   * @param store Backing store; must outlive this object
   * @param key Key the state is stored under
   */
  Persistence(KeyValueStore &store, const std::string &key);

  Roe<void> save(const std::vector<Block> &chain,
                 const std::vector<Transaction> &pending);

  /**
   * Restore the last saved state.
   * Block nonces and hashes are restored as stored, without recomputation.
   */
  Roe<State> load() const;

  Roe<void> remove();

  const std::string &getKey() const { return key_; }

  static std::string encode(const std::vector<Block> &chain,
                            const std::vector<Transaction> &pending);
  static Roe<State> decode(const std::string &blob);

private:
  KeyValueStore &store_;
  std::string key_;
};

} // namespace vnc

#endif // VNC_LEDGER_PERSISTENCE_H
