#ifndef VNC_LEDGER_FILE_KV_STORE_H
#define VNC_LEDGER_FILE_KV_STORE_H

#include "KeyValueStore.hpp"

#include <string>

namespace vnc {

/**
 * Directory-backed key-value store: one file per key at <dir>/<key>.json.
 * Writes go to a temporary file that is renamed over the old value.
 */
class FileKvStore : public KeyValueStore {
public:
  explicit FileKvStore(const std::string &dirPath);
  ~FileKvStore() override = default;

  Roe<std::string> load(const std::string &key) const override;
  Roe<void> save(const std::string &key, const std::string &value) override;
  Roe<void> remove(const std::string &key) override;

  const std::string &getDirPath() const { return dirPath_; }
  std::string getFilePath(const std::string &key) const;

private:
  std::string dirPath_;
};

} // namespace vnc

#endif // VNC_LEDGER_FILE_KV_STORE_H
