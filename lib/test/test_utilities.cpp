#include "Utilities.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace vnc {
namespace utl {

class UtilitiesFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() /
               ("vnc_utilities_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    cleanupTestDir();
  }

  void TearDown() override {
    cleanupTestDir();
  }

  void cleanupTestDir() {
    std::error_code ec;
    if (std::filesystem::exists(testDir_, ec)) {
      std::filesystem::remove_all(testDir_, ec);
    }
  }

  std::filesystem::path testDir_;
};

TEST(HexEncodeTest, EncodesBytes) {
  const unsigned char data[] = {0x00, 0x0f, 0xa5, 0xff};
  EXPECT_EQ(hexEncode(data, sizeof(data)), "000fa5ff");
  EXPECT_EQ(hexEncode(data, 0), "");
}

TEST(TimeTest, CurrentTimeIsMilliseconds) {
  int64_t first = getCurrentTimeMillis();
  int64_t second = getCurrentTimeMillis();
  EXPECT_GT(first, 1600000000000LL);
  EXPECT_GE(second, first);
}

TEST_F(UtilitiesFileTest, WriteAndReadFile) {
  std::string path = (testDir_ / "sub" / "file.txt").string();
  ASSERT_TRUE(writeFileAtomic(path, "content").isOk());

  auto content = readFile(path);
  ASSERT_TRUE(content.isOk()) << content.error().message;
  EXPECT_EQ(content.value(), "content");
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

  ASSERT_TRUE(writeFileAtomic(path, "").isOk());
  EXPECT_EQ(readFile(path).value(), "");
}

TEST_F(UtilitiesFileTest, ReadMissingFile) {
  auto content = readFile((testDir_ / "missing.txt").string());
  ASSERT_TRUE(content.isError());
  EXPECT_EQ(content.error().code, 1);
}

TEST_F(UtilitiesFileTest, LoadJsonFile) {
  std::string path = (testDir_ / "config.json").string();
  ASSERT_TRUE(writeFileAtomic(path, "{\"difficulty\": 4}").isOk());

  auto json = loadJsonFile(path);
  ASSERT_TRUE(json.isOk()) << json.error().message;
  EXPECT_EQ(json.value()["difficulty"], 4);
}

TEST_F(UtilitiesFileTest, LoadJsonFileErrors) {
  EXPECT_EQ(loadJsonFile((testDir_ / "missing.json").string()).error().code, 1);

  std::string path = (testDir_ / "broken.json").string();
  ASSERT_TRUE(writeFileAtomic(path, "{\"difficulty\": ").isOk());
  auto json = loadJsonFile(path);
  ASSERT_TRUE(json.isError());
  EXPECT_EQ(json.error().code, 3);
  EXPECT_NE(json.error().message.find(path), std::string::npos);
}

} // namespace utl
} // namespace vnc
