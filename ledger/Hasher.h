#ifndef VNC_LEDGER_HASHER_H
#define VNC_LEDGER_HASHER_H

#include <cstddef>
#include <string>

namespace vnc {

/**
 * SHA-256 digests of byte strings.
 */
class Hasher {
public:
  static constexpr size_t DIGEST_SIZE = 32;
  static constexpr size_t HEX_DIGEST_SIZE = DIGEST_SIZE * 2;

  /**
   * Compute the SHA-256 digest of input
   * @param input Bytes to hash
   * @return Lowercase hex digest (64 characters)
   * @throws std::runtime_error if the digest computation fails
   */
  static std::string digest(const std::string &input);
};

} // namespace vnc

#endif // VNC_LEDGER_HASHER_H
