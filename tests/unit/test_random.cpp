/**
 * Cloak - Random Number Generator Tests
 */

#include <gtest/gtest.h>
#include "common/random.hpp"

#include <set>
#include <stdexcept>

using namespace cloak;

TEST(RandomTest, NextIntRange) {
    Random rng(12345);

    for (int i = 0; i < 100; i++) {
        int val = rng.nextInt(0, 10);
        EXPECT_GE(val, 0);
        EXPECT_LE(val, 10);
    }
    for (int i = 0; i < 100; i++) {
        EXPECT_LT(rng.nextInt(4), 4);
    }
}

TEST(RandomTest, DecideAlways) {
    Random rng(12345);

    EXPECT_TRUE(rng.decide(1.0));
    EXPECT_FALSE(rng.decide(0.0));
    EXPECT_FALSE(rng.decide(-0.5));
}

TEST(RandomTest, DecideProbability) {
    Random rng(12345);

    int count = 0;
    for (int i = 0; i < 1000; i++) {
        if (rng.decide(0.5)) count++;
    }

    // roughly half
    EXPECT_GT(count, 400);
    EXPECT_LT(count, 600);
}

TEST(RandomTest, WeightedChoice) {
    Random rng(12345);

    int rare = 0;
    for (int i = 0; i < 1000; i++) {
        if (rng.chooseWeighted({0.1, 0.9}) == 0) rare++;
    }
    EXPECT_GT(rare, 50);
    EXPECT_LT(rare, 200);

    // zero weight is never picked
    for (int i = 0; i < 200; i++) {
        EXPECT_NE(rng.chooseWeighted({1.0, 0.0, 1.0}), 1u);
    }
}

TEST(RandomTest, EmptyChoicesThrow) {
    Random rng(1);
    std::vector<int> none;

    EXPECT_THROW(rng.choose(none), std::runtime_error);
    EXPECT_THROW(rng.chooseWeighted({}), std::runtime_error);
    EXPECT_THROW(rng.nextSize(0), std::invalid_argument);
}

TEST(RandomTest, Reproducibility) {
    Random rng1(42);
    Random rng2(42);

    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(rng1.nextUint32(), rng2.nextUint32());
    }
    EXPECT_EQ(rng1.getSeed(), 42u);
}

TEST(RandomTest, ReseedRestartsSequence) {
    Random rng(7);
    uint32_t first = rng.nextUint32();
    rng.nextUint32();

    rng.seed(7);
    EXPECT_EQ(rng.nextUint32(), first);
}

TEST(RandomTest, NonZeroBytesAndStrings) {
    Random rng(99);

    for (int i = 0; i < 500; i++) {
        EXPECT_NE(rng.nextNonZeroByte(), 0);
    }

    std::string s = rng.nextString("ab", 64);
    EXPECT_EQ(s.size(), 64u);
    std::set<char> seen(s.begin(), s.end());
    for (char c : seen) EXPECT_TRUE(c == 'a' || c == 'b');
}
