#ifndef VNC_LEDGER_TRANSACTION_H
#define VNC_LEDGER_TRANSACTION_H

#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace vnc {

/**
 * Value transfer between two addresses.
 * Amount sign is not constrained; only finiteness is checked.
 */
struct Transaction {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const char *NETWORK_ADDRESS = "network";

  std::string from;
  std::string to;
  double amount{ 0 };

  Transaction() = default;
  Transaction(std::string from, std::string to, double amount);

  /**
   * Check the record is well formed: non-empty UTF-8 from and to, finite amount
   * @return Error with a readable reason when malformed
   */
  Roe<void> validate() const;

  nlohmann::json toJson() const;
  static Roe<Transaction> fromJson(const nlohmann::json &j);

  bool operator==(const Transaction &other) const;
  bool operator!=(const Transaction &other) const { return !(*this == other); }
};

std::ostream &operator<<(std::ostream &os, const Transaction &tx);

} // namespace vnc

#endif // VNC_LEDGER_TRANSACTION_H
