#include "Balance.h"

#include <unordered_set>

namespace vnc {

namespace {

void applyTransaction(const std::string &address, const Transaction &tx,
                      double &balance) {
  if (tx.from == address) {
    balance -= tx.amount;
  }
  if (tx.to == address) {
    balance += tx.amount;
  }
}

void addAddress(const std::string &address, std::unordered_set<std::string> &seen,
                std::vector<std::string> &addresses) {
  if (seen.insert(address).second) {
    addresses.push_back(address);
  }
}

} // namespace

double balanceOf(const std::string &address, const std::vector<Block> &chain,
                 const std::vector<Transaction> &pending) {
  double balance = 0;
  for (const auto &block : chain) {
    for (const auto &tx : block.getTransactions()) {
      applyTransaction(address, tx, balance);
    }
  }
  for (const auto &tx : pending) {
    applyTransaction(address, tx, balance);
  }
  return balance;
}

std::vector<std::string> collectAddresses(const std::vector<Block> &chain,
                                          const std::vector<Transaction> &pending) {
  std::unordered_set<std::string> seen;
  std::vector<std::string> addresses;
  for (const auto &block : chain) {
    for (const auto &tx : block.getTransactions()) {
      addAddress(tx.from, seen, addresses);
      addAddress(tx.to, seen, addresses);
    }
  }
  for (const auto &tx : pending) {
    addAddress(tx.from, seen, addresses);
    addAddress(tx.to, seen, addresses);
  }
  return addresses;
}

} // namespace vnc
