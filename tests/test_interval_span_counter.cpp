#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "core/IntervalSpanCounter.hpp"

using namespace MiteSeq;

class IntervalSpanCounterTest : public ::testing::Test {
protected:
    void SetUp() override {
        counter.add_count(0, 10);
        counter.add_count(2, 5);
        counter.add_count(3, 8);
    }

    IntervalSpanCounter counter{10};
};

TEST_F(IntervalSpanCounterTest, CountsMoleculesCoveringTheQuery) {
    EXPECT_EQ(counter.count_spanners(2, 5), 2);
    EXPECT_EQ(counter.count_spanners(3, 8), 2);
    EXPECT_EQ(counter.count_spanners(3, 5), 3);
    EXPECT_EQ(counter.count_spanners(0, 10), 1);
}

TEST_F(IntervalSpanCounterTest, QueryOutsideReferenceHasNoSpanners) {
    EXPECT_EQ(counter.count_spanners(-5, 4), 0);
    EXPECT_EQ(counter.count_spanners(2, 12), 0);
}

TEST_F(IntervalSpanCounterTest, MergeAddsCounts) {
    IntervalSpanCounter other(10);
    other.add_count(0, 10);
    counter.merge(other);
    EXPECT_EQ(counter.count_spanners(0, 10), 2);
    EXPECT_EQ(counter.count_spanners(3, 5), 4);
}

TEST_F(IntervalSpanCounterTest, MergeRejectsDifferentReference) {
    IntervalSpanCounter other(12);
    EXPECT_THROW(counter.merge(other), InternalError);
}

TEST_F(IntervalSpanCounterTest, RejectsSpanOutsideReference) {
    EXPECT_THROW(counter.add_count(5, 11), InternalError);
    EXPECT_THROW(counter.add_count(-1, 3), InternalError);
    EXPECT_THROW(counter.add_count(6, 4), InternalError);
}
