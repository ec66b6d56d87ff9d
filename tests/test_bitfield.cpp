#include <gtest/gtest.h>
#include "bitfield.h"

using namespace blockshare;

TEST(BitfieldTest, StartsClear) {
    Bitfield bits(10);
    EXPECT_EQ(bits.size(), 10u);
    EXPECT_EQ(bits.count(), 0u);
    EXPECT_FALSE(bits.all_set());
    EXPECT_EQ(bits.to_string(), "0000000000");
}

TEST(BitfieldTest, EmptyBitfieldIsComplete) {
    Bitfield bits;
    EXPECT_TRUE(bits.empty());
    EXPECT_TRUE(bits.all_set());
    EXPECT_TRUE(bits.clear_indices().empty());
}

TEST(BitfieldTest, SetAndClearReportTransitions) {
    Bitfield bits(8);
    EXPECT_TRUE(bits.set_bit(3));
    EXPECT_FALSE(bits.set_bit(3));
    EXPECT_TRUE(bits[3]);
    EXPECT_EQ(bits.count(), 1u);

    EXPECT_TRUE(bits.clear_bit(3));
    EXPECT_FALSE(bits.clear_bit(3));
    EXPECT_FALSE(bits.get_bit(3));
    EXPECT_EQ(bits.count(), 0u);
}

TEST(BitfieldTest, OutOfRangeIsIgnored) {
    Bitfield bits(4);
    EXPECT_FALSE(bits.set_bit(4));
    EXPECT_FALSE(bits.get_bit(100));
    EXPECT_EQ(bits.count(), 0u);
}

TEST(BitfieldTest, AllSetAcrossWordBoundary) {
    Bitfield bits(130);
    for (size_t i = 0; i < 130; ++i) {
        bits.set_bit(i);
    }
    EXPECT_TRUE(bits.all_set());
    EXPECT_EQ(bits.find_next_clear(0), 130u);

    bits.clear_bit(64);
    EXPECT_FALSE(bits.all_set());
    EXPECT_EQ(bits.find_next_clear(0), 64u);
    EXPECT_EQ(bits.find_next_clear(65), 130u);
}

TEST(BitfieldTest, ClearIndicesAscending) {
    Bitfield bits(6);
    bits.set_bit(0);
    bits.set_bit(2);
    bits.set_bit(5);
    std::vector<uint32_t> expected = {1, 3, 4};
    EXPECT_EQ(bits.clear_indices(), expected);
    EXPECT_EQ(bits.to_string(), "101001");
}

TEST(BitfieldTest, FirstClearInBoth) {
    Bitfield owned(70);
    Bitfield claimed(70);
    for (size_t i = 0; i < 66; ++i) {
        if (i % 2 == 0) {
            owned.set_bit(i);
        } else {
            claimed.set_bit(i);
        }
    }
    EXPECT_EQ(owned.find_first_clear_in_both(claimed), 66u);

    claimed.set_bit(66);
    claimed.set_bit(67);
    owned.set_bit(68);
    EXPECT_EQ(owned.find_first_clear_in_both(claimed), 69u);

    owned.set_bit(69);
    EXPECT_EQ(owned.find_first_clear_in_both(claimed), 70u);
}

TEST(BitfieldTest, Equality) {
    Bitfield a(12);
    Bitfield b(12);
    EXPECT_EQ(a, b);
    a.set_bit(7);
    EXPECT_NE(a, b);
    b.set_bit(7);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, Bitfield(13));
}
