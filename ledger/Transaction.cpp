#include "Transaction.h"

#include <cmath>
#include <ostream>

namespace vnc {

namespace {

// Addresses are hashed and stored as JSON text, which must be valid UTF-8
bool isValidUtf8(const std::string &text) {
  try {
    nlohmann::json(text).dump();
  } catch (const nlohmann::json::type_error &) {
    return false;
  }
  return true;
}

} // namespace

Transaction::Transaction(std::string from, std::string to, double amount)
    : from(std::move(from)), to(std::move(to)), amount(amount) {}

Transaction::Roe<void> Transaction::validate() const {
  if (from.empty()) {
    return Error(1, "Invalid transaction: missing sender");
  }
  if (to.empty()) {
    return Error(2, "Invalid transaction: missing recipient");
  }
  if (!isValidUtf8(from)) {
    return Error(4, "Invalid transaction: sender is not valid UTF-8");
  }
  if (!isValidUtf8(to)) {
    return Error(5, "Invalid transaction: recipient is not valid UTF-8");
  }
  if (!std::isfinite(amount)) {
    return Error(3, "Invalid transaction: amount is not a finite number");
  }
  return {};
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["from"] = from;
  j["to"] = to;
  j["amount"] = amount;
  return j;
}

Transaction::Roe<Transaction> Transaction::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(10, "Transaction record is not an object");
  }
  if (!j.contains("from") || !j["from"].is_string()) {
    return Error(11, "Transaction record missing string field 'from'");
  }
  if (!j.contains("to") || !j["to"].is_string()) {
    return Error(12, "Transaction record missing string field 'to'");
  }
  if (!j.contains("amount") || !j["amount"].is_number()) {
    return Error(13, "Transaction record missing numeric field 'amount'");
  }

  Transaction tx;
  tx.from = j["from"].get<std::string>();
  tx.to = j["to"].get<std::string>();
  tx.amount = j["amount"].get<double>();
  return tx;
}

bool Transaction::operator==(const Transaction &other) const {
  return from == other.from && to == other.to && amount == other.amount;
}

std::ostream &operator<<(std::ostream &os, const Transaction &tx) {
  os << tx.from << " -> " << tx.to << " : " << tx.amount;
  return os;
}

} // namespace vnc
