#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "core/QualityTrimmer.hpp"

using namespace MiteSeq;

TEST(QualityTrimmerTest, AllHighQualityKeepsWholeRead) {
    QualityTrimmer trimmer(30, 5);
    std::vector<uint8_t> quals(10, 40);
    EXPECT_EQ(trimmer.calculate_trim(quals), Interval(0, 10));
}

TEST(QualityTrimmerTest, TrimsLowQualityEnds) {
    QualityTrimmer trimmer(30, 3);
    std::vector<uint8_t> quals = {10, 12, 40, 40, 40, 40, 35, 20, 2};
    EXPECT_EQ(trimmer.calculate_trim(quals), Interval(2, 7));
}

TEST(QualityTrimmerTest, KeepsLowQualityBaseBetweenGoodRuns) {
    QualityTrimmer trimmer(30, 3);
    std::vector<uint8_t> quals = {10, 40, 40, 40, 10, 40, 40, 40, 40, 40};
    EXPECT_EQ(trimmer.calculate_trim(quals), Interval(1, 10));
}

TEST(QualityTrimmerTest, ShortRunsGiveEmptyTrim) {
    QualityTrimmer trimmer(30, 4);
    std::vector<uint8_t> quals = {40, 40, 40, 10, 40, 40, 40, 10, 40};
    EXPECT_TRUE(trimmer.calculate_trim(quals).empty());
}

TEST(QualityTrimmerTest, ReadShorterThanMinLengthIsEmpty) {
    QualityTrimmer trimmer(30, 15);
    std::vector<uint8_t> quals(14, 40);
    EXPECT_TRUE(trimmer.calculate_trim(quals).empty());
    EXPECT_TRUE(trimmer.calculate_trim({}).empty());
}

TEST(QualityTrimmerTest, QualityEqualToThresholdPasses) {
    QualityTrimmer trimmer(30, 2);
    std::vector<uint8_t> quals = {29, 30, 30, 29};
    EXPECT_EQ(trimmer.calculate_trim(quals), Interval(1, 3));
}

TEST(QualityTrimmerTest, RejectsNonPositiveMinLength) {
    EXPECT_THROW(QualityTrimmer(30, 0), UserError);
}
