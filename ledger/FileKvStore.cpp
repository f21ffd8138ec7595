#include "FileKvStore.h"
#include "../lib/Utilities.h"

#include <filesystem>

namespace vnc {

FileKvStore::FileKvStore(const std::string &dirPath)
    : KeyValueStore("vnc.kvstore"), dirPath_(dirPath) {}

std::string FileKvStore::getFilePath(const std::string &key) const {
  return (std::filesystem::path(dirPath_) / (key + ".json")).string();
}

FileKvStore::Roe<std::string> FileKvStore::load(const std::string &key) const {
  if (!isValidKey(key)) {
    return Error(E_KEY, "Invalid key: '" + key + "'");
  }

  std::string path = getFilePath(key);
  auto result = utl::readFile(path);
  if (!result) {
    if (result.error().code == 1) {
      return Error(E_NOT_FOUND, "No value for key: " + key);
    }
    return Error(E_IO, result.error().message);
  }

  log().debug << "Loaded " << result.value().size() << " bytes from " << path;
  return result.value();
}

FileKvStore::Roe<void> FileKvStore::save(const std::string &key, const std::string &value) {
  if (!isValidKey(key)) {
    return Error(E_KEY, "Invalid key: '" + key + "'");
  }

  std::string path = getFilePath(key);
  auto result = utl::writeFileAtomic(path, value);
  if (!result) {
    return Error(E_IO, result.error().message);
  }

  log().debug << "Saved " << value.size() << " bytes to " << path;
  return {};
}

FileKvStore::Roe<void> FileKvStore::remove(const std::string &key) {
  if (!isValidKey(key)) {
    return Error(E_KEY, "Invalid key: '" + key + "'");
  }

  std::string path = getFilePath(key);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    return Error(E_IO, "Failed to remove " + path + ": " + ec.message());
  }

  log().debug << "Removed " << path;
  return {};
}

} // namespace vnc
