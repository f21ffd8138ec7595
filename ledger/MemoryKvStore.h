#ifndef VNC_LEDGER_MEMORY_KV_STORE_H
#define VNC_LEDGER_MEMORY_KV_STORE_H

#include "KeyValueStore.hpp"

#include <map>
#include <mutex>
#include <string>

namespace vnc {

/**
 * In-process key-value store.
 * Reads and writes can be made to fail to exercise degraded paths.
 */
class MemoryKvStore : public KeyValueStore {
public:
  MemoryKvStore();
  ~MemoryKvStore() override = default;

  Roe<std::string> load(const std::string &key) const override;
  Roe<void> save(const std::string &key, const std::string &value) override;
  Roe<void> remove(const std::string &key) override;

  bool contains(const std::string &key) const;
  size_t getSaveCount() const;

  void setFailLoads(bool fail);
  void setFailSaves(bool fail);

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> values_;
  size_t saveCount_{ 0 };
  bool failLoads_{ false };
  bool failSaves_{ false };
};

} // namespace vnc

#endif // VNC_LEDGER_MEMORY_KV_STORE_H
