#include "Block.h"
#include "Hasher.h"

#include <sstream>

namespace vnc {

bool hasLeadingZeros(const std::string &hash, uint32_t difficulty) {
  if (hash.size() < difficulty) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; i++) {
    if (hash[i] != '0') {
      return false;
    }
  }
  return true;
}

Block::Block(int64_t timestamp, std::vector<Transaction> transactions,
             std::string previousHash)
    : timestamp_(timestamp), transactions_(std::move(transactions)),
      previousHash_(std::move(previousHash)) {}

Block Block::genesis(int64_t timestamp) {
  Block block(timestamp, {Transaction("genesis", Transaction::NETWORK_ADDRESS, 0)},
              GENESIS_HASH);
  block.hash_ = GENESIS_HASH;
  return block;
}

std::string Block::computeFingerprint() const {
  nlohmann::json txs = nlohmann::json::array();
  for (const auto &tx : transactions_) {
    txs.push_back(tx.toJson());
  }

  std::ostringstream oss;
  oss << previousHash_ << '|' << timestamp_ << '|' << txs.dump() << '|' << nonce_;
  return oss.str();
}

std::string Block::calculateHash() const {
  return Hasher::digest(computeFingerprint());
}

bool Block::meetsDifficulty(uint32_t difficulty) const {
  return hasLeadingZeros(hash_, difficulty);
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["timestamp"] = timestamp_;
  nlohmann::json txs = nlohmann::json::array();
  for (const auto &tx : transactions_) {
    txs.push_back(tx.toJson());
  }
  j["transactions"] = txs;
  j["previousHash"] = previousHash_;
  j["nonce"] = nonce_;
  j["hash"] = hash_;
  return j;
}

Block::Roe<Block> Block::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(1, "Block record is not an object");
  }
  if (!j.contains("timestamp") || !j["timestamp"].is_number_integer()) {
    return Error(2, "Block record missing integer field 'timestamp'");
  }
  if (!j.contains("transactions") || !j["transactions"].is_array()) {
    return Error(3, "Block record missing array field 'transactions'");
  }
  if (!j.contains("previousHash") || !j["previousHash"].is_string()) {
    return Error(4, "Block record missing string field 'previousHash'");
  }
  if (!j.contains("nonce") || !j["nonce"].is_number_unsigned()) {
    return Error(5, "Block record missing non-negative integer field 'nonce'");
  }
  if (!j.contains("hash") || !j["hash"].is_string()) {
    return Error(6, "Block record missing string field 'hash'");
  }

  std::vector<Transaction> transactions;
  const auto &txs = j["transactions"];
  for (size_t i = 0; i < txs.size(); i++) {
    auto txResult = Transaction::fromJson(txs[i]);
    if (!txResult) {
      return Error(7, "Transaction " + std::to_string(i) + ": " + txResult.error().message);
    }
    transactions.push_back(txResult.value());
  }

  Block block(j["timestamp"].get<int64_t>(), std::move(transactions),
              j["previousHash"].get<std::string>());
  block.nonce_ = j["nonce"].get<uint64_t>();
  block.hash_ = j["hash"].get<std::string>();
  return block;
}

bool Block::operator==(const Block &other) const {
  return timestamp_ == other.timestamp_ && transactions_ == other.transactions_ &&
         previousHash_ == other.previousHash_ && nonce_ == other.nonce_ &&
         hash_ == other.hash_;
}

} // namespace vnc
