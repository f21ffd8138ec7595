#include "../Block.h"
#include "../Hasher.h"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace vnc;

class BlockTest : public ::testing::Test {
protected:
  Block createTestBlock() {
    Block block(1000, {Transaction("alice", "bob", 5)}, "abc");
    block.setNonce(7);
    return block;
  }
};

TEST_F(BlockTest, FingerprintLayout) {
  Block block = createTestBlock();
  EXPECT_EQ(block.computeFingerprint(),
            "abc|1000|[{\"amount\":5.0,\"from\":\"alice\",\"to\":\"bob\"}]|7");
}

TEST_F(BlockTest, FingerprintOfEmptyBlock) {
  Block block(42, {}, "prev");
  EXPECT_EQ(block.computeFingerprint(), "prev|42|[]|0");
}

TEST_F(BlockTest, CalculateHashDigestsFingerprint) {
  Block block = createTestBlock();
  EXPECT_EQ(block.calculateHash(), Hasher::digest(block.computeFingerprint()));
}

TEST_F(BlockTest, HashCoversEveryField) {
  Block block = createTestBlock();
  std::string original = block.calculateHash();

  Block changed = block;
  changed.setNonce(8);
  EXPECT_NE(changed.calculateHash(), original);

  changed = block;
  changed.setTimestamp(1001);
  EXPECT_NE(changed.calculateHash(), original);

  changed = block;
  changed.setPreviousHash("abd");
  EXPECT_NE(changed.calculateHash(), original);

  changed = block;
  changed.mutableTransactions()[0].amount = 50;
  EXPECT_NE(changed.calculateHash(), original);

  changed = block;
  changed.mutableTransactions().push_back(Transaction("bob", "carol", 1));
  EXPECT_NE(changed.calculateHash(), original);
}

TEST_F(BlockTest, StoredHashIsNotRecomputed) {
  Block block = createTestBlock();
  block.setHash("deadbeef");
  block.setNonce(9);
  EXPECT_EQ(block.getHash(), "deadbeef");
}

TEST_F(BlockTest, TransactionOrderMatters) {
  Block ab(1, {Transaction("a", "b", 1), Transaction("b", "a", 2)}, "p");
  Block ba(1, {Transaction("b", "a", 2), Transaction("a", "b", 1)}, "p");
  EXPECT_NE(ab.calculateHash(), ba.calculateHash());
}

TEST_F(BlockTest, GenesisBlock) {
  Block genesis = Block::genesis(123);
  EXPECT_EQ(genesis.getTimestamp(), 123);
  EXPECT_EQ(genesis.getPreviousHash(), "0");
  EXPECT_EQ(genesis.getHash(), "0");
  EXPECT_EQ(genesis.getNonce(), 0u);
  ASSERT_EQ(genesis.getTransactions().size(), 1u);
  EXPECT_EQ(genesis.getTransactions()[0], Transaction("genesis", "network", 0));
}

TEST_F(BlockTest, MeetsDifficulty) {
  Block block = createTestBlock();
  block.setHash("000abc");
  EXPECT_TRUE(block.meetsDifficulty(0));
  EXPECT_TRUE(block.meetsDifficulty(3));
  EXPECT_FALSE(block.meetsDifficulty(4));

  EXPECT_TRUE(hasLeadingZeros("00", 2));
  EXPECT_FALSE(hasLeadingZeros("0", 2));
  EXPECT_FALSE(hasLeadingZeros("a000", 1));
}

TEST_F(BlockTest, JsonRoundTripKeepsSeal) {
  Block block = createTestBlock();
  block.setHash(block.calculateHash());

  nlohmann::json j = block.toJson();
  EXPECT_EQ(j["timestamp"], 1000);
  EXPECT_EQ(j["previousHash"], "abc");
  EXPECT_EQ(j["nonce"], 7);
  EXPECT_EQ(j["hash"], block.getHash());
  ASSERT_TRUE(j["transactions"].is_array());

  auto restored = Block::fromJson(j);
  ASSERT_TRUE(restored.isOk()) << restored.error().message;
  EXPECT_EQ(restored.value(), block);
}

TEST_F(BlockTest, FromJsonKeepsMismatchedHash) {
  nlohmann::json j = createTestBlock().toJson();
  j["hash"] = "not-a-real-hash";

  auto restored = Block::fromJson(j);
  ASSERT_TRUE(restored.isOk());
  EXPECT_EQ(restored->getHash(), "not-a-real-hash");
}

TEST_F(BlockTest, FromJsonRejectsMalformedRecords) {
  EXPECT_TRUE(Block::fromJson(nlohmann::json::array()).isError());

  nlohmann::json j = createTestBlock().toJson();
  j.erase("nonce");
  auto missingNonce = Block::fromJson(j);
  ASSERT_TRUE(missingNonce.isError());
  EXPECT_EQ(missingNonce.error().code, 5);

  j = createTestBlock().toJson();
  j["nonce"] = -1;
  EXPECT_TRUE(Block::fromJson(j).isError());

  j = createTestBlock().toJson();
  j["previousHash"] = 12;
  EXPECT_TRUE(Block::fromJson(j).isError());

  j = createTestBlock().toJson();
  j["transactions"][0].erase("to");
  auto badTx = Block::fromJson(j);
  ASSERT_TRUE(badTx.isError());
  EXPECT_EQ(badTx.error().code, 7);
}

TEST(TransactionTest, Validate) {
  EXPECT_TRUE(Transaction("a", "b", 1).validate().isOk());
  EXPECT_TRUE(Transaction("a", "b", -3.5).validate().isOk());
  EXPECT_TRUE(Transaction("a", "a", 0).validate().isOk());

  EXPECT_EQ(Transaction("", "b", 1).validate().error().code, 1);
  EXPECT_EQ(Transaction("a", "", 1).validate().error().code, 2);
  EXPECT_EQ(Transaction("a", "b", std::nan("")).validate().error().code, 3);
  EXPECT_EQ(Transaction("a\xFF", "b", 1).validate().error().code, 4);
  EXPECT_EQ(Transaction("a", "\x80", 1).validate().error().code, 5);
  EXPECT_TRUE(Transaction("\xC3\xA9", "b", 1).validate().isOk());
  EXPECT_EQ(Transaction("a", "b", std::numeric_limits<double>::infinity())
                .validate()
                .error()
                .code,
            3);
}

TEST(TransactionTest, JsonRoundTrip) {
  Transaction tx("alice", "bob", 2.5);
  auto restored = Transaction::fromJson(tx.toJson());
  ASSERT_TRUE(restored.isOk());
  EXPECT_EQ(restored.value(), tx);

  auto integral = Transaction::fromJson({{"from", "a"}, {"to", "b"}, {"amount", 3}});
  ASSERT_TRUE(integral.isOk());
  EXPECT_DOUBLE_EQ(integral->amount, 3.0);

  EXPECT_TRUE(Transaction::fromJson({{"from", "a"}, {"to", "b"}}).isError());
  EXPECT_TRUE(Transaction::fromJson({{"from", "a"}, {"to", "b"}, {"amount", "1"}}).isError());
}
