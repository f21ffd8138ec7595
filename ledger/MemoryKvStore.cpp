#include "MemoryKvStore.h"

namespace vnc {

MemoryKvStore::MemoryKvStore() : KeyValueStore("vnc.kvstore") {}

MemoryKvStore::Roe<std::string> MemoryKvStore::load(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failLoads_) {
    return Error(E_IO, "Store is unreadable");
  }
  auto it = values_.find(key);
  if (it == values_.end()) {
    return Error(E_NOT_FOUND, "No value for key: " + key);
  }
  return it->second;
}

MemoryKvStore::Roe<void> MemoryKvStore::save(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failSaves_) {
    return Error(E_IO, "Store is unwritable");
  }
  if (!isValidKey(key)) {
    return Error(E_KEY, "Invalid key: '" + key + "'");
  }
  values_[key] = value;
  saveCount_++;
  return {};
}

MemoryKvStore::Roe<void> MemoryKvStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failSaves_) {
    return Error(E_IO, "Store is unwritable");
  }
  values_.erase(key);
  return {};
}

bool MemoryKvStore::contains(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.find(key) != values_.end();
}

size_t MemoryKvStore::getSaveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return saveCount_;
}

void MemoryKvStore::setFailLoads(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  failLoads_ = fail;
}

void MemoryKvStore::setFailSaves(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  failSaves_ = fail;
}

} // namespace vnc
