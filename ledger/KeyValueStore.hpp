#ifndef VNC_LEDGER_KEY_VALUE_STORE_HPP
#define VNC_LEDGER_KEY_VALUE_STORE_HPP

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <string>

namespace vnc {

/**
 * Blob store addressed by string keys.
 * The ledger is the only writer of the keys it uses.
 */
class KeyValueStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_NOT_FOUND = 1;
  static constexpr int32_t E_IO = 2;
  static constexpr int32_t E_KEY = 3;

  explicit KeyValueStore(const std::string &name) : Module(name) {}
  ~KeyValueStore() override = default;

  /**
   * Read the blob stored under key
   * @return Bytes, or E_NOT_FOUND when the key has no value
   */
  virtual Roe<std::string> load(const std::string &key) const = 0;

  /**
   * Store bytes under key, replacing any previous value
   */
  virtual Roe<void> save(const std::string &key, const std::string &value) = 0;

  /**
   * Delete the value under key. Removing a missing key succeeds.
   */
  virtual Roe<void> remove(const std::string &key) = 0;

  /**
   * Keys are non-empty, use [A-Za-z0-9_.-] only and do not start with '.'
   */
  static bool isValidKey(const std::string &key) {
    if (key.empty() || key[0] == '.') {
      return false;
    }
    for (char c : key) {
      bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
      if (!ok) {
        return false;
      }
    }
    return true;
  }
};

} // namespace vnc

#endif // VNC_LEDGER_KEY_VALUE_STORE_HPP
