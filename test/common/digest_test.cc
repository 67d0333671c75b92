#include <gtest/gtest.h>
#include "../../src/common/digest.h"

using namespace Fleetshard;

TEST(DigestTest, Sha256KnownVector) {
    auto hash = Sha256("abc");
    EXPECT_EQ(hash[0], 0xba);
    EXPECT_EQ(hash[1], 0x78);
    EXPECT_EQ(hash[31], 0xad);
}

TEST(DigestTest, PrefixIsBigEndianFirstEightBytes) {
    EXPECT_EQ(Sha256Prefix64(""), 0xe3b0c44298fc1c14ULL);
    EXPECT_EQ(Sha256Prefix64("abc"), 0xba7816bf8f01cfeaULL);
}

TEST(DigestTest, DistinctInputsDistinctPrefixes) {
    EXPECT_NE(Sha256Prefix64("1:shard_0:"), Sha256Prefix64("1:shard_1:"));
}
