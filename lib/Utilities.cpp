#include "Utilities.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace vnc {
namespace utl {

int64_t getCurrentTimeMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string hexEncode(const unsigned char *data, size_t size) {
  std::stringstream ss;
  for (size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  auto content = readFile(path);
  if (!content) {
    return content.error();
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(content.value());
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + std::string(e.what()));
  }

  return json;
}

Roe<void> writeFileAtomic(const std::string &path, const std::string &content) {
  std::filesystem::path filePath(path);
  std::filesystem::path parentDir = filePath.parent_path();
  std::error_code ec;
  if (!parentDir.empty() && !std::filesystem::exists(parentDir, ec)) {
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(1, "Failed to create parent directories for " + path + ": " + ec.message());
    }
  }

  std::string tempPath = path + ".tmp";
  {
    std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return Error(2, "Failed to open file for writing: " + tempPath);
    }
    file << content;
    file.flush();
    if (!file.good()) {
      return Error(3, "Failed to write content to file: " + tempPath);
    }
  }

  std::filesystem::rename(tempPath, filePath, ec);
  if (ec) {
    std::filesystem::remove(tempPath, ec);
    return Error(4, "Failed to rename " + tempPath + " to " + path);
  }
  return {};
}

Roe<std::string> readFile(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Error(2, "Failed to read file: " + path);
  }
  return content;
}

} // namespace utl
} // namespace vnc
