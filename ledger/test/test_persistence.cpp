#include "../Persistence.h"
#include "../MemoryKvStore.h"
#include <gtest/gtest.h>

using namespace vnc;

class PersistenceTest : public ::testing::Test {
protected:
  std::vector<Block> createTestChain() {
    std::vector<Block> chain;
    chain.push_back(Block::genesis(1000));

    Block block(2000, {Transaction("alice", "bob", 2.5)}, chain.back().getHash());
    block.setNonce(17);
    block.setHash(block.calculateHash());
    chain.push_back(block);
    return chain;
  }

  MemoryKvStore store_;
};

TEST_F(PersistenceTest, SaveAndLoad) {
  Persistence persistence(store_, "chain_a");
  auto chain = createTestChain();
  std::vector<Transaction> pending = {Transaction("network", "carol", 1)};

  ASSERT_TRUE(persistence.save(chain, pending).isOk());
  EXPECT_TRUE(store_.contains("chain_a"));

  auto state = persistence.load();
  ASSERT_TRUE(state.isOk()) << state.error().message;
  EXPECT_EQ(state->chain, chain);
  EXPECT_EQ(state->pending, pending);
}

TEST_F(PersistenceTest, LoadMissingKey) {
  Persistence persistence(store_, "missing");
  auto state = persistence.load();
  ASSERT_TRUE(state.isError());
  EXPECT_EQ(state.error().code, Persistence::E_NOT_FOUND);
}

TEST_F(PersistenceTest, BlobLayout) {
  auto chain = createTestChain();
  nlohmann::json j = nlohmann::json::parse(Persistence::encode(chain, {}));

  ASSERT_TRUE(j.is_object());
  ASSERT_TRUE(j["chain"].is_array());
  ASSERT_EQ(j["chain"].size(), 2u);
  EXPECT_EQ(j["chain"][1]["nonce"], 17);
  EXPECT_EQ(j["chain"][1]["hash"], chain[1].getHash());
  EXPECT_EQ(j["chain"][1]["transactions"][0]["from"], "alice");
  ASSERT_TRUE(j["pending"].is_array());
  EXPECT_TRUE(j["pending"].empty());
}

TEST_F(PersistenceTest, MissingPendingRestoresEmpty) {
  nlohmann::json j = nlohmann::json::parse(Persistence::encode(createTestChain(), {}));
  j.erase("pending");

  auto state = Persistence::decode(j.dump());
  ASSERT_TRUE(state.isOk()) << state.error().message;
  EXPECT_EQ(state->chain.size(), 2u);
  EXPECT_TRUE(state->pending.empty());

  j["pending"] = nullptr;
  state = Persistence::decode(j.dump());
  ASSERT_TRUE(state.isOk());
  EXPECT_TRUE(state->pending.empty());
}

TEST_F(PersistenceTest, DecodeRejectsCorruptBlobs) {
  EXPECT_EQ(Persistence::decode("").error().code, Persistence::E_PARSE);
  EXPECT_EQ(Persistence::decode("{\"chain\": [").error().code, Persistence::E_PARSE);
  EXPECT_EQ(Persistence::decode("[]").error().code, Persistence::E_FORMAT);
  EXPECT_EQ(Persistence::decode("{}").error().code, Persistence::E_FORMAT);
  EXPECT_EQ(Persistence::decode("{\"chain\": 5}").error().code, Persistence::E_FORMAT);
  EXPECT_EQ(Persistence::decode("{\"chain\": [{\"hash\": \"x\"}]}").error().code,
            Persistence::E_FORMAT);
  EXPECT_EQ(Persistence::decode("{\"chain\": [], \"pending\": {}}").error().code,
            Persistence::E_FORMAT);
  EXPECT_EQ(Persistence::decode("{\"chain\": [], \"pending\": [{\"from\": \"a\"}]}")
                .error()
                .code,
            Persistence::E_FORMAT);
}

TEST_F(PersistenceTest, LoadKeepsStoredHashes) {
  auto chain = createTestChain();
  chain[1].setHash("forged");
  Persistence persistence(store_, "chain_a");
  ASSERT_TRUE(persistence.save(chain, {}).isOk());

  auto state = persistence.load();
  ASSERT_TRUE(state.isOk());
  EXPECT_EQ(state->chain[1].getHash(), "forged");
}

TEST_F(PersistenceTest, StoreFailures) {
  Persistence persistence(store_, "chain_a");
  ASSERT_TRUE(persistence.save(createTestChain(), {}).isOk());

  store_.setFailLoads(true);
  EXPECT_EQ(persistence.load().error().code, Persistence::E_IO);

  store_.setFailSaves(true);
  EXPECT_EQ(persistence.save(createTestChain(), {}).error().code, Persistence::E_IO);
  EXPECT_EQ(persistence.remove().error().code, Persistence::E_IO);
}

TEST_F(PersistenceTest, Remove) {
  Persistence persistence(store_, "chain_a");
  ASSERT_TRUE(persistence.save(createTestChain(), {}).isOk());

  ASSERT_TRUE(persistence.remove().isOk());
  EXPECT_FALSE(store_.contains("chain_a"));
  EXPECT_EQ(persistence.load().error().code, Persistence::E_NOT_FOUND);
  EXPECT_TRUE(persistence.remove().isOk());
}
