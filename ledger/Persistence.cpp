#include "Persistence.h"

#include <nlohmann/json.hpp>

namespace vnc {

Persistence::Persistence(KeyValueStore &store, const std::string &key)
    : Module("vnc.persistence"), store_(store), key_(key) {}

std::string Persistence::encode(const std::vector<Block> &chain,
                                const std::vector<Transaction> &pending) {
  nlohmann::json j;
  j["chain"] = nlohmann::json::array();
  for (const auto &block : chain) {
    j["chain"].push_back(block.toJson());
  }
  j["pending"] = nlohmann::json::array();
  for (const auto &tx : pending) {
    j["pending"].push_back(tx.toJson());
  }
  return j.dump();
}

Persistence::Roe<Persistence::State> Persistence::decode(const std::string &blob) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(blob);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(E_PARSE, "Failed to parse stored state: " + std::string(e.what()));
  }

  if (!j.is_object()) {
    return Error(E_FORMAT, "Stored state is not an object");
  }
  if (!j.contains("chain") || !j["chain"].is_array()) {
    return Error(E_FORMAT, "Stored state missing array field 'chain'");
  }

  State state;
  const auto &chain = j["chain"];
  for (size_t i = 0; i < chain.size(); i++) {
    auto blockResult = Block::fromJson(chain[i]);
    if (!blockResult) {
      return Error(E_FORMAT, "Block " + std::to_string(i) + ": " + blockResult.error().message);
    }
    state.chain.push_back(blockResult.value());
  }

  // A blob without a pending queue restores as an empty queue
  if (j.contains("pending") && !j["pending"].is_null()) {
    const auto &pending = j["pending"];
    if (!pending.is_array()) {
      return Error(E_FORMAT, "Stored state field 'pending' is not an array");
    }
    for (size_t i = 0; i < pending.size(); i++) {
      auto txResult = Transaction::fromJson(pending[i]);
      if (!txResult) {
        return Error(E_FORMAT, "Pending transaction " + std::to_string(i) + ": " +
                                   txResult.error().message);
      }
      state.pending.push_back(txResult.value());
    }
  }

  return state;
}

Persistence::Roe<void> Persistence::save(const std::vector<Block> &chain,
                                         const std::vector<Transaction> &pending) {
  std::string blob;
  try {
    blob = encode(chain, pending);
  } catch (const nlohmann::json::exception &e) {
    return Error(E_FORMAT, "Failed to encode state: " + std::string(e.what()));
  }
  auto result = store_.save(key_, blob);
  if (!result) {
    return Error(E_IO, "Failed to save '" + key_ + "': " + result.error().message);
  }
  log().debug << "Saved state '" << key_ << "': blocks=" << chain.size()
              << ", pending=" << pending.size();
  return {};
}

Persistence::Roe<Persistence::State> Persistence::load() const {
  auto blob = store_.load(key_);
  if (!blob) {
    if (blob.error().code == KeyValueStore::E_NOT_FOUND) {
      return Error(E_NOT_FOUND, "No saved state under '" + key_ + "'");
    }
    return Error(E_IO, "Failed to load '" + key_ + "': " + blob.error().message);
  }

  auto state = decode(blob.value());
  if (!state) {
    return state.error();
  }
  log().debug << "Loaded state '" << key_ << "': blocks=" << state->chain.size()
              << ", pending=" << state->pending.size();
  return state;
}

Persistence::Roe<void> Persistence::remove() {
  auto result = store_.remove(key_);
  if (!result) {
    return Error(E_IO, "Failed to remove '" + key_ + "': " + result.error().message);
  }
  return {};
}

} // namespace vnc
