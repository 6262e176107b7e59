#include "Block.h"
#include <gtest/gtest.h>

using namespace fv;

TEST(BlockTest, GenesisIsFixedAndShared) {
    Block first = Block::genesis();
    Block second = Block::genesis();

    EXPECT_EQ(first.getHeight(), 0u);
    EXPECT_EQ(first.getId(), "00000000-0000-0000-0000-000000000000");
    EXPECT_FALSE(first.hasParent());
    EXPECT_TRUE(first.isGenesis());
    EXPECT_EQ(first, second);
}

TEST(BlockTest, CreateGeneratesFreshIdentifier) {
    SeededRandom rng(11);
    Block a = Block::create(1, Block::GENESIS_ID, rng);
    Block b = Block::create(1, Block::GENESIS_ID, rng);

    EXPECT_EQ(a.getHeight(), 1u);
    EXPECT_EQ(a.getParentId(), Block::GENESIS_ID);
    EXPECT_TRUE(a.hasParent());
    EXPECT_FALSE(a.isGenesis());
    EXPECT_NE(a.getId(), b.getId());
    EXPECT_NE(a, b);
}

TEST(BlockTest, AdoptKeepsIdentityButReparents) {
    SeededRandom rng(12);
    Block parent = Block::create(1, Block::GENESIS_ID, rng);
    Block reference = Block::create(2, parent.getId(), rng);
    Block localTip = Block::create(1, Block::GENESIS_ID, rng);

    Block adopted = Block::adopt(reference, localTip.getId());

    EXPECT_EQ(adopted.getHeight(), reference.getHeight());
    EXPECT_EQ(adopted.getId(), reference.getId());
    EXPECT_EQ(adopted.getParentId(), localTip.getId());
    EXPECT_NE(adopted.getParentId(), reference.getParentId());
}

TEST(BlockTest, ToStringShortensIdentifiers) {
    SeededRandom rng(13);
    Block block = Block::create(1, Block::GENESIS_ID, rng);

    EXPECT_EQ(Block::genesis().toString(), "Block(h=0, hash=000000, parent=None)");
    EXPECT_EQ(block.toString(),
              "Block(h=1, hash=" + block.getId().substr(0, 6) + ", parent=000000)");
    EXPECT_EQ(block.toString(0),
              "Block(h=1, hash=" + block.getId() + ", parent=" + Block::GENESIS_ID + ")");
}

TEST(BlockTest, ShortIdHandlesLengths) {
    EXPECT_EQ(shortId("abcdef123", 3), "abc");
    EXPECT_EQ(shortId("abc", 10), "abc");
    EXPECT_EQ(shortId("abcdef", 0), "abcdef");
}
