#include <gtest/gtest.h>
#include "sequence_manager.hpp"
#include "memory_storage.hpp"

using namespace erebus;

class SequenceManagerTest : public ::testing::Test {
protected:
    MemoryStorage storage;
    int64_t now = 1700000000000;
    SequenceManager seq{storage, [this]() { return now; }};
};

TEST_F(SequenceManagerTest, StartsAtZero) {
    EXPECT_EQ(seq.get_current_sequence("p", "c", "t"), "0");
}

TEST_F(SequenceManagerTest, StrictlyIncreasingWithinOneMillisecond) {
    std::string prev = "0";
    for (int i = 0; i < 200; ++i) {
        auto s = seq.generate_sequence("p", "c", "t");
        EXPECT_TRUE(SequenceManager::is_sequence_after(s, prev)) << s << " <= " << prev;
        EXPECT_EQ(SequenceManager::decode_sequence_time(s), static_cast<uint64_t>(now));
        prev = s;
    }
    EXPECT_EQ(seq.get_current_sequence("p", "c", "t"), prev);
}

TEST_F(SequenceManagerTest, NeverGoesBackwardsWhenClockDoes) {
    auto first = seq.generate_sequence("p", "c", "t");
    now -= 5000;
    auto second = seq.generate_sequence("p", "c", "t");
    EXPECT_GT(second, first);
    EXPECT_EQ(SequenceManager::decode_sequence_time(second), 1700000000000ULL);
}

TEST_F(SequenceManagerTest, AdvancesWithTime) {
    auto first = seq.generate_sequence("p", "c", "t");
    now += 10;
    auto second = seq.generate_sequence("p", "c", "t");
    EXPECT_EQ(SequenceManager::decode_sequence_time(second), static_cast<uint64_t>(now));
    EXPECT_GT(second, first);
}

TEST_F(SequenceManagerTest, TopicsAreIndependent) {
    seq.generate_sequence("p", "c", "a");
    EXPECT_EQ(seq.get_current_sequence("p", "c", "b"), "0");
}

TEST_F(SequenceManagerTest, SurvivesRestartOverSameStorage) {
    auto last = seq.generate_sequence("p", "c", "t");
    SequenceManager restarted(storage, [this]() { return now; });
    auto next = restarted.generate_sequence("p", "c", "t");
    EXPECT_GT(next, last);
}

TEST(SequenceCompareTest, ZeroOrdersFirst) {
    EXPECT_LT(SequenceManager::compare_sequences("0", "01H0000000000000000000000A"), 0);
    EXPECT_GT(SequenceManager::compare_sequences("01H0000000000000000000000A", "0"), 0);
    EXPECT_EQ(SequenceManager::compare_sequences("0", "0"), 0);
}
