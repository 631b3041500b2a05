#include <gtest/gtest.h>

#include "membership/Hash.hpp"

using Gossamer::Membership::Hash;
using Gossamer::Membership::computeHash;

TEST(Hash, Sha3OfEmptyInput) {
    EXPECT_EQ(computeHash("").toHex(),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(Hash, Sha3OfAbc) {
    EXPECT_EQ(computeHash("abc").toHex(),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(Hash, ShortHexIsPrefix) {
    Hash h = computeHash("abc");
    EXPECT_EQ(h.shortHex(), "3a985da7");
}

TEST(Hash, OrderingIsLexicographicOnBytes) {
    Hash low;
    Hash high;
    high.bytes[0] = 1;
    EXPECT_LT(low, high);
    EXPECT_FALSE(high < low);
    EXPECT_NE(low, high);

    Hash tail;
    tail.bytes[Hash::SIZE - 1] = 0xff;
    EXPECT_LT(tail, high);
}

TEST(Hash, DifferentInputsDiffer) {
    EXPECT_NE(computeHash("node-a"), computeHash("node-b"));
    EXPECT_EQ(computeHash("node-a"), computeHash("node-a"));
}
