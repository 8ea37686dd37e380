#include "FileVoteStore.h"
#include "MemoryVoteStore.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

using namespace hv;

namespace {

// Store tests do not check proof of work, any hash is accepted
VoteBlock makeBlock(const std::string &poll, const std::string &voter,
                    const std::string &prev, uint64_t nonce = 0) {
  VoteBlock block;
  block.pollId = poll;
  block.voterHash = utl::deriveVoterHash(voter);
  block.choice = "yes";
  block.timestampUs = 1700000000000000 + static_cast<int64_t>(nonce);
  block.prevHash = prev;
  block.nonce = nonce;
  block.blockHash = block.computeHash();
  return block;
}

enum class StoreKind { MEMORY, FILE };

class VoteStoreTest : public ::testing::TestWithParam<StoreKind> {
protected:
  std::string testDir = "/tmp/hashvote-store-test";
  std::unique_ptr<VoteStore> store;

  void SetUp() override {
    std::filesystem::remove_all(testDir);
    if (GetParam() == StoreKind::MEMORY) {
      store = std::make_unique<MemoryVoteStore>();
    } else {
      auto fileStore = std::make_unique<FileVoteStore>();
      ASSERT_TRUE(fileStore->open(testDir + "/ledger.dat").isOk());
      store = std::move(fileStore);
    }
  }

  void TearDown() override {
    store.reset();
    std::filesystem::remove_all(testDir);
  }
};

} // namespace

TEST_P(VoteStoreTest, EmptyPollHasGenesisTip) {
  auto tip = store->getTip("p1");
  ASSERT_TRUE(tip.isOk());
  EXPECT_EQ(tip.value(), pow::GENESIS_HASH);
  EXPECT_TRUE(store->readPoll("p1").value().empty());
  EXPECT_TRUE(store->readAll().value().empty());
}

TEST_P(VoteStoreTest, AppendAssignsSequenceAndMovesTip) {
  auto first = store->append(makeBlock("p1", "alice", pow::GENESIS_HASH));
  ASSERT_TRUE(first.isOk());
  EXPECT_EQ(first.value().id, 1u);

  auto other = store->append(makeBlock("p2", "alice", pow::GENESIS_HASH));
  ASSERT_TRUE(other.isOk());
  EXPECT_EQ(other.value().id, 2u);

  auto second =
      store->append(makeBlock("p1", "bob", first.value().blockHash, 1));
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(second.value().id, 3u);

  EXPECT_EQ(store->getTip("p1").value(), second.value().blockHash);
  EXPECT_EQ(store->getTip("p2").value(), other.value().blockHash);

  auto poll = store->readPoll("p1").value();
  ASSERT_EQ(poll.size(), 2u);
  EXPECT_EQ(poll[0].id, 1u);
  EXPECT_EQ(poll[1].id, 3u);
  EXPECT_EQ(store->readAll().value().size(), 3u);
}

TEST_P(VoteStoreTest, DuplicateVoterIsRejected) {
  auto first = store->append(makeBlock("p1", "alice", pow::GENESIS_HASH));
  ASSERT_TRUE(first.isOk());

  auto again = makeBlock("p1", "alice", first.value().blockHash, 5);
  again.choice = "no";
  again.blockHash = again.computeHash();
  auto result = store->append(again);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, VoteStore::E_DUPLICATE_VOTER);
  EXPECT_EQ(store->readAll().value().size(), 1u);
}

TEST_P(VoteStoreTest, StaleTipIsRejected) {
  ASSERT_TRUE(store->append(makeBlock("p1", "alice", pow::GENESIS_HASH)));
  auto result = store->append(makeBlock("p1", "bob", pow::GENESIS_HASH, 1));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, VoteStore::E_STALE_TIP);
}

TEST_P(VoteStoreTest, DuplicateBlockHashIsRejected) {
  auto first = store->append(makeBlock("p1", "alice", pow::GENESIS_HASH));
  ASSERT_TRUE(first.isOk());
  auto copy = makeBlock("p2", "bob", pow::GENESIS_HASH);
  copy.blockHash = first.value().blockHash;
  auto result = store->append(copy);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, VoteStore::E_DUPLICATE_HASH);
}

TEST_P(VoteStoreTest, FindVote) {
  ASSERT_TRUE(store->append(makeBlock("p1", "alice", pow::GENESIS_HASH)));
  auto found = store->findVote("p1", utl::deriveVoterHash("alice"));
  ASSERT_TRUE(found.isOk());
  ASSERT_TRUE(found.value().has_value());
  EXPECT_EQ(found.value()->pollId, "p1");

  auto missing = store->findVote("p2", utl::deriveVoterHash("alice"));
  ASSERT_TRUE(missing.isOk());
  EXPECT_FALSE(missing.value().has_value());
}

INSTANTIATE_TEST_SUITE_P(AllStores, VoteStoreTest,
                         ::testing::Values(StoreKind::MEMORY, StoreKind::FILE));

TEST(MemoryVoteStoreTest, AppendUncheckedBypassesRules) {
  MemoryVoteStore store;
  auto block = makeBlock("p1", "alice", pow::GENESIS_HASH);
  store.appendUnchecked(block);
  store.appendUnchecked(block);
  auto all = store.readAll().value();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[1].id, 2u);
}
