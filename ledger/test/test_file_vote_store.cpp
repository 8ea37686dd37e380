#include "FileVoteStore.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace hv;

namespace {

VoteBlock makeBlock(const std::string &poll, const std::string &voter,
                    const std::string &prev) {
  VoteBlock block;
  block.pollId = poll;
  block.voterHash = utl::deriveVoterHash(voter);
  block.choice = "yes";
  block.timestampUs = 1700000000000000;
  block.prevHash = prev;
  block.nonce = 3;
  block.blockHash = block.computeHash();
  return block;
}

class FileVoteStoreTest : public ::testing::Test {
protected:
  std::string testDir = "/tmp/hashvote-file-store-test";
  std::string testFile = testDir + "/ledger.dat";

  void SetUp() override { std::filesystem::remove_all(testDir); }
  void TearDown() override { std::filesystem::remove_all(testDir); }
};

} // namespace

TEST_F(FileVoteStoreTest, CreatesFileWithHeader) {
  FileVoteStore store;
  ASSERT_TRUE(store.open(testFile).isOk());
  EXPECT_TRUE(store.isOpen());
  EXPECT_EQ(std::filesystem::file_size(testFile), FileVoteStore::HEADER_SIZE);

  auto again = store.open(testFile);
  EXPECT_TRUE(again.isError());
}

TEST_F(FileVoteStoreTest, BlocksSurviveReopen) {
  std::string tip;
  {
    FileVoteStore store;
    ASSERT_TRUE(store.open(testFile).isOk());
    auto a = store.append(makeBlock("p1", "alice", pow::GENESIS_HASH));
    ASSERT_TRUE(a.isOk());
    auto b = store.append(makeBlock("p1", "bob", a.value().blockHash));
    ASSERT_TRUE(b.isOk());
    tip = b.value().blockHash;
  }

  FileVoteStore store;
  ASSERT_TRUE(store.open(testFile).isOk());
  auto blocks = store.readPoll("p1");
  ASSERT_TRUE(blocks.isOk());
  ASSERT_EQ(blocks.value().size(), 2u);
  EXPECT_EQ(blocks.value()[0].voterHash, utl::deriveVoterHash("alice"));
  EXPECT_EQ(blocks.value()[1].id, 2u);
  EXPECT_EQ(store.getTip("p1").value(), tip);
}

TEST_F(FileVoteStoreTest, SeesAppendsFromOtherInstances) {
  FileVoteStore first;
  FileVoteStore second;
  ASSERT_TRUE(first.open(testFile).isOk());
  ASSERT_TRUE(second.open(testFile).isOk());

  auto a = first.append(makeBlock("p1", "alice", pow::GENESIS_HASH));
  ASSERT_TRUE(a.isOk());

  // second has a stale view until it refreshes under the lock
  auto stale = second.append(makeBlock("p1", "bob", pow::GENESIS_HASH));
  ASSERT_TRUE(stale.isError());
  EXPECT_EQ(stale.error().code, VoteStore::E_STALE_TIP);

  auto dup = second.append(makeBlock("p1", "alice", a.value().blockHash));
  ASSERT_TRUE(dup.isError());
  EXPECT_EQ(dup.error().code, VoteStore::E_DUPLICATE_VOTER);

  auto b = second.append(makeBlock("p1", "bob", a.value().blockHash));
  ASSERT_TRUE(b.isOk());
  EXPECT_EQ(b.value().id, 2u);
  EXPECT_EQ(first.readAll().value().size(), 2u);
}

TEST_F(FileVoteStoreTest, ConcurrentAppendsKeepOneChain) {
  FileVoteStore store;
  ASSERT_TRUE(store.open(testFile).isOk());

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t]() {
      FileVoteStore own;
      ASSERT_TRUE(own.open(testFile).isOk());
      for (int i = 0; i < 10; ++i) {
        std::string voter = "voter-" + std::to_string(t) + "-" + std::to_string(i);
        while (true) {
          auto tip = own.getTip("p1");
          ASSERT_TRUE(tip.isOk());
          auto result = own.append(makeBlock("p1", voter, tip.value()));
          if (result) {
            break;
          }
          ASSERT_EQ(result.error().code, VoteStore::E_STALE_TIP);
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  auto blocks = store.readPoll("p1").value();
  ASSERT_EQ(blocks.size(), 40u);
  std::string expected = pow::GENESIS_HASH;
  for (size_t i = 0; i < blocks.size(); ++i) {
    EXPECT_EQ(blocks[i].id, i + 1);
    EXPECT_EQ(blocks[i].prevHash, expected);
    expected = blocks[i].blockHash;
  }
}

TEST_F(FileVoteStoreTest, TruncatedTrailingRecordIsIgnoredThenReplaced) {
  uintmax_t sizeAfterFirst = 0;
  std::string tip;
  {
    FileVoteStore store;
    ASSERT_TRUE(store.open(testFile).isOk());
    auto a = store.append(makeBlock("p1", "alice", pow::GENESIS_HASH));
    ASSERT_TRUE(a.isOk());
    tip = a.value().blockHash;
    sizeAfterFirst = std::filesystem::file_size(testFile);
    auto b = store.append(makeBlock("p1", "bob", tip));
    ASSERT_TRUE(b.isOk());
  }
  // Simulate a crash in the middle of writing the second record
  std::filesystem::resize_file(testFile, sizeAfterFirst + 20);

  FileVoteStore store;
  ASSERT_TRUE(store.open(testFile).isOk());
  EXPECT_EQ(store.readAll().value().size(), 1u);
  EXPECT_EQ(store.getTip("p1").value(), tip);

  auto c = store.append(makeBlock("p1", "carol", tip));
  ASSERT_TRUE(c.isOk());
  EXPECT_EQ(c.value().id, 2u);

  FileVoteStore reopened;
  ASSERT_TRUE(reopened.open(testFile).isOk());
  auto blocks = reopened.readAll().value();
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks[1].voterHash, utl::deriveVoterHash("carol"));
}

TEST_F(FileVoteStoreTest, RejectsForeignFile) {
  std::filesystem::create_directories(testDir);
  {
    std::ofstream out(testFile, std::ios::binary);
    out << "definitely not a ledger";
  }
  FileVoteStore store;
  auto result = store.open(testFile);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, VoteStore::E_CORRUPT);
  EXPECT_FALSE(store.isOpen());
}

TEST_F(FileVoteStoreTest, OperationsFailWhenClosed) {
  FileVoteStore store;
  EXPECT_TRUE(store.readAll().isError());
  auto result = store.append(makeBlock("p1", "alice", pow::GENESIS_HASH));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, VoteStore::E_IO);
}
