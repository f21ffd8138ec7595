#ifndef VNC_LEDGER_BALANCE_H
#define VNC_LEDGER_BALANCE_H

#include "Block.h"
#include "Transaction.h"

#include <string>
#include <vector>

namespace vnc {

/**
 * Net balance of an address over the sealed chain followed by the pending
 * queue. Debits on `from`, credits on `to`; both are applied independently,
 * so a self-transfer nets to zero. Unknown addresses have balance 0.
 */
double balanceOf(const std::string &address, const std::vector<Block> &chain,
                 const std::vector<Transaction> &pending);

/**
 * Every address named as sender or recipient, in first-seen order
 * (chain order, then pending queue).
 */
std::vector<std::string> collectAddresses(const std::vector<Block> &chain,
                                          const std::vector<Transaction> &pending);

} // namespace vnc

#endif // VNC_LEDGER_BALANCE_H
