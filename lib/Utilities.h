#ifndef VNC_LEDGER_UTILITIES_H
#define VNC_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace vnc {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in milliseconds since the epoch
 * @return Current time in milliseconds
 */
int64_t getCurrentTimeMillis();

/**
 * Encode binary data as a lowercase hex string
 * @param data Raw bytes
 * @param size Number of bytes
 * @return Hex string (two chars per byte)
 */
std::string hexEncode(const unsigned char *data, size_t size);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON, or error (1: not found, 2: unreadable, 3: parse error)
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Replace a file's content: writes <path>.tmp then renames it over <path>.
 * Creates parent directories if needed.
 * @param path Destination file
 * @param content Bytes to write
 */
Roe<void> writeFileAtomic(const std::string &path, const std::string &content);

/**
 * Read a whole file into a string
 * @param path File to read
 * @return Content, or error (1: not found, 2: unreadable)
 */
Roe<std::string> readFile(const std::string &path);

} // namespace utl
} // namespace vnc

#endif // VNC_LEDGER_UTILITIES_H
