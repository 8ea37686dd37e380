#include "BlockHasher.h"
#include "../../lib/Utilities.h"
#include <gtest/gtest.h>

using namespace hv::pow;

namespace {

BlockFields sampleFields() {
  BlockFields fields;
  fields.pollId = "p1";
  fields.voterHash = hv::utl::deriveVoterHash("alice");
  fields.choice = "yes";
  fields.timestampUs = 1700000000123456;
  fields.prevHash = GENESIS_HASH;
  return fields;
}

} // namespace

TEST(BlockHasherTest, GenesisIsSixtyFourZeros) {
  EXPECT_EQ(GENESIS_HASH.size(), 64u);
  EXPECT_EQ(GENESIS_HASH.find_first_not_of('0'), std::string::npos);
}

TEST(BlockHasherTest, CanonicalInputConcatenatesFields) {
  auto fields = sampleFields();
  std::string expected = "p1" + fields.voterHash + "yes" +
                         "2023-11-14T22:13:20.123456" + GENESIS_HASH + "42";
  EXPECT_EQ(canonicalInput(fields, 42), expected);
  EXPECT_EQ(computeHash(fields, 42), hv::utl::sha256(expected));
}

TEST(BlockHasherTest, NonceIsUnsignedDecimal) {
  auto fields = sampleFields();
  std::string input = canonicalInput(fields, UINT64_MAX);
  EXPECT_EQ(input.substr(input.size() - 20), "18446744073709551615");
  EXPECT_EQ(canonicalInput(fields, 0).back(), '0');
}

TEST(BlockHasherTest, IsDeterministic) {
  auto fields = sampleFields();
  EXPECT_EQ(computeHash(fields, 7), computeHash(fields, 7));
  EXPECT_TRUE(hv::utl::isLowerHex(computeHash(fields, 7), 64));
}

TEST(BlockHasherTest, EveryFieldAffectsHash) {
  auto base = sampleFields();
  std::string h = computeHash(base, 7);

  auto f = base;
  f.pollId = "p2";
  EXPECT_NE(computeHash(f, 7), h);

  f = base;
  f.voterHash = hv::utl::deriveVoterHash("bob");
  EXPECT_NE(computeHash(f, 7), h);

  f = base;
  f.choice = "no";
  EXPECT_NE(computeHash(f, 7), h);

  f = base;
  f.timestampUs += 1;
  EXPECT_NE(computeHash(f, 7), h);

  f = base;
  f.prevHash = std::string(64, 'f');
  EXPECT_NE(computeHash(f, 7), h);

  EXPECT_NE(computeHash(base, 8), h);
}

TEST(BlockHasherTest, IncrementalHasherMatchesFullHash) {
  auto fields = sampleFields();
  BlockHasher hasher(fields);
  for (uint64_t nonce : { 0ULL, 1ULL, 9ULL, 10ULL, 123456789ULL, 18446744073709551615ULL }) {
    EXPECT_EQ(hasher.hexDigest(nonce), computeHash(fields, nonce)) << nonce;
  }
}
