#include "../FileKvStore.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace vnc;

class FileKvStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() /
               ("vnc_file_kv_store_test_" +
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

TEST_F(FileKvStoreTest, LoadMissingKey) {
  FileKvStore store(testDir_.string());
  auto result = store.load("nothing");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, KeyValueStore::E_NOT_FOUND);
}

TEST_F(FileKvStoreTest, SaveCreatesDirectory) {
  FileKvStore store((testDir_ / "nested" / "data").string());
  ASSERT_TRUE(store.save("vnc_blockchain", "{}").isOk());
  EXPECT_TRUE(std::filesystem::exists(testDir_ / "nested" / "data" / "vnc_blockchain.json"));
}

TEST_F(FileKvStoreTest, SaveAndLoad) {
  FileKvStore store(testDir_.string());
  ASSERT_TRUE(store.save("key", "first value").isOk());

  auto loaded = store.load("key");
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
  EXPECT_EQ(loaded.value(), "first value");

  ASSERT_TRUE(store.save("key", "second").isOk());
  EXPECT_EQ(store.load("key").value(), "second");
  EXPECT_FALSE(std::filesystem::exists(store.getFilePath("key") + ".tmp"));
}

TEST_F(FileKvStoreTest, ValuesSurviveNewInstance) {
  {
    FileKvStore store(testDir_.string());
    ASSERT_TRUE(store.save("persisted", "payload").isOk());
  }
  FileKvStore reopened(testDir_.string());
  auto loaded = reopened.load("persisted");
  ASSERT_TRUE(loaded.isOk());
  EXPECT_EQ(loaded.value(), "payload");
}

TEST_F(FileKvStoreTest, Remove) {
  FileKvStore store(testDir_.string());
  ASSERT_TRUE(store.save("key", "value").isOk());
  ASSERT_TRUE(store.remove("key").isOk());
  EXPECT_FALSE(std::filesystem::exists(store.getFilePath("key")));
  EXPECT_EQ(store.load("key").error().code, KeyValueStore::E_NOT_FOUND);

  EXPECT_TRUE(store.remove("key").isOk());
}

TEST_F(FileKvStoreTest, RejectsInvalidKeys) {
  FileKvStore store(testDir_.string());
  EXPECT_EQ(store.save("", "x").error().code, KeyValueStore::E_KEY);
  EXPECT_EQ(store.save("../escape", "x").error().code, KeyValueStore::E_KEY);
  EXPECT_EQ(store.save(".hidden", "x").error().code, KeyValueStore::E_KEY);
  EXPECT_EQ(store.load("a/b").error().code, KeyValueStore::E_KEY);
  EXPECT_EQ(store.remove("a b").error().code, KeyValueStore::E_KEY);
  EXPECT_FALSE(std::filesystem::exists(testDir_));
}

TEST_F(FileKvStoreTest, KeyValidation) {
  EXPECT_TRUE(KeyValueStore::isValidKey("vnc_blockchain"));
  EXPECT_TRUE(KeyValueStore::isValidKey("chain-2.backup"));
  EXPECT_FALSE(KeyValueStore::isValidKey(""));
  EXPECT_FALSE(KeyValueStore::isValidKey(".."));
  EXPECT_FALSE(KeyValueStore::isValidKey("a/b"));
}

TEST_F(FileKvStoreTest, ReadsFileWrittenExternally) {
  std::filesystem::create_directories(testDir_);
  {
    std::ofstream file(testDir_ / "external.json");
    file << "{\"chain\":[]}";
  }
  FileKvStore store(testDir_.string());
  auto loaded = store.load("external");
  ASSERT_TRUE(loaded.isOk());
  EXPECT_EQ(loaded.value(), "{\"chain\":[]}");
}
