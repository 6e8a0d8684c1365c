#include <gtest/gtest.h>

#include "core/CodonEncoder.hpp"
#include "core/CodonTranslation.hpp"
#include "core/Errors.hpp"

using namespace MiteSeq;

namespace {

// ATG AAA TAG
const std::string SIMPLE_REF = "ATGAAATAG";
// ATGA ttt AATAG: the second codon straddles the intron
const std::string SPLIT_REF = "ATGATTTAATAG";

constexpr int ATG = 14;
constexpr int AAA = 0;
constexpr int ACA = 4;
constexpr int CAA = 16;
constexpr int CCC = 21;
constexpr int TAG = 50;

}  // namespace

// ============================================================================
// ORF parsing
// ============================================================================

TEST(CodonEncoderTest, ParsesSingleExon) {
    auto exons = CodonEncoder::parse_exons("1-9", 9);
    ASSERT_EQ(exons.size(), 2u);
    EXPECT_EQ(exons[0], Interval(0, 9));
    EXPECT_EQ(exons[1].start, INFINITE_POSITION);
}

TEST(CodonEncoderTest, ParsesMultipleExons) {
    auto exons = CodonEncoder::parse_exons("134-180,214-238", 300);
    ASSERT_EQ(exons.size(), 3u);
    EXPECT_EQ(exons[0], Interval(133, 180));
    EXPECT_EQ(exons[1], Interval(213, 238));
}

TEST(CodonEncoderTest, RejectsMalformedOrfs) {
    EXPECT_THROW(CodonEncoder::parse_exons("", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("1-9-12", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("19", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("a-9", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("1-9x", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("0-8", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("9-1", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("1-8", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("1-12", 9), UserError);
}

TEST(CodonEncoderTest, RejectsUnsortedOrTouchingExons) {
    EXPECT_THROW(CodonEncoder::parse_exons("10-15,1-3", 100), UserError);
    EXPECT_THROW(CodonEncoder::parse_exons("1-3,3-8", 100), UserError);
}

// ============================================================================
// Reference codons
// ============================================================================

TEST(CodonEncoderTest, ReferenceCodonValues) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    EXPECT_EQ(encoder.num_codons(), 3);
    EXPECT_EQ(encoder.ref_codon_values(), (std::vector<int>{ATG, AAA, TAG}));
    EXPECT_EQ(encoder.codon_counts().rows(), 3);
    EXPECT_EQ(encoder.codon_counts().cols(), CODON_COUNT_ROW_SIZE);
    EXPECT_EQ(CodonTranslation::codon_label(ATG), "ATG");
    EXPECT_EQ(CodonTranslation::codon_label(TAG), "TAG");
}

TEST(CodonEncoderTest, CodonAcrossIntron) {
    CodonEncoder encoder("1-4,8-12", SPLIT_REF);
    EXPECT_EQ(encoder.ref_codon_values(), (std::vector<int>{ATG, AAA, TAG}));
    EXPECT_TRUE(encoder.is_exonic(3));
    EXPECT_FALSE(encoder.is_exonic(4));
    EXPECT_FALSE(encoder.is_exonic(6));
    EXPECT_TRUE(encoder.is_exonic(7));
    EXPECT_EQ(encoder.exonic_base_count(5), 4);
    EXPECT_EQ(encoder.exonic_base_count(9), 6);
    EXPECT_EQ(encoder.exonic_base_count(12), 9);
}

TEST(CodonEncoderTest, UpstreamStopIsFatal) {
    EXPECT_THROW(CodonEncoder("1-12", "ATGTAAAAATAG"), UserError);
}

TEST(CodonEncoderTest, NonAcgtInOrfIsFatal) {
    EXPECT_THROW(CodonEncoder("1-9", "ATGNAATAG"), UserError);
}

TEST(CodonEncoderTest, MissingStartAndStopOnlyWarn) {
    EXPECT_NO_THROW(CodonEncoder("1-6", "AAAAAA"));
}

TEST(CodonEncoderTest, StopCodons) {
    EXPECT_TRUE(CodonEncoder::is_stop(0x30));
    EXPECT_TRUE(CodonEncoder::is_stop(0x32));
    EXPECT_TRUE(CodonEncoder::is_stop(0x38));
    EXPECT_FALSE(CodonEncoder::is_stop(ATG));
}

// ============================================================================
// encode_snvs_as_codons
// ============================================================================

TEST(CodonEncoderTest, SubstitutionAtCodonStart) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    auto variations = encoder.encode_snvs_as_codons({Snv(3, 'A', 'C', 40)});
    ASSERT_EQ(variations.size(), 1u);
    EXPECT_EQ(variations[0], CodonVariation(1, CAA, CodonVariationType::MODIFICATION));
}

TEST(CodonEncoderTest, SubstitutionInMidCodon) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    auto variations = encoder.encode_snvs_as_codons({Snv(4, 'A', 'C', 40)});
    ASSERT_EQ(variations.size(), 1u);
    EXPECT_EQ(variations[0], CodonVariation(1, ACA, CodonVariationType::MODIFICATION));
}

TEST(CodonEncoderTest, SubstitutionAcrossIntron) {
    CodonEncoder encoder("1-4,8-12", SPLIT_REF);
    auto variations = encoder.encode_snvs_as_codons({Snv(7, 'A', 'C', 40)});
    ASSERT_EQ(variations.size(), 1u);
    EXPECT_EQ(variations[0], CodonVariation(1, ACA, CodonVariationType::MODIFICATION));
}

TEST(CodonEncoderTest, IntronicSnvsAreIgnored) {
    CodonEncoder encoder("1-4,8-12", SPLIT_REF);
    EXPECT_TRUE(encoder.encode_snvs_as_codons({Snv(5, 'T', 'C', 40)}).empty());
}

TEST(CodonEncoderTest, InFrameInsertion) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    SnvList snvs = {Snv(3, NO_CALL, 'C', 40), Snv(3, NO_CALL, 'C', 40), Snv(3, NO_CALL, 'C', 40)};
    auto variations = encoder.encode_snvs_as_codons(snvs);
    ASSERT_EQ(variations.size(), 1u);
    EXPECT_EQ(variations[0], CodonVariation(1, CCC, CodonVariationType::INSERTION));
}

TEST(CodonEncoderTest, InFrameDeletion) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    SnvList snvs = {Snv(3, 'A', NO_CALL, 40), Snv(4, 'A', NO_CALL, 40), Snv(5, 'A', NO_CALL, 40)};
    auto variations = encoder.encode_snvs_as_codons(snvs);
    ASSERT_EQ(variations.size(), 1u);
    EXPECT_TRUE(variations[0].is_deletion());
    EXPECT_EQ(variations[0].codon_id, 1);
}

TEST(CodonEncoderTest, EncodingStopsAtNewStopCodon) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    auto variations = encoder.encode_snvs_as_codons({Snv(3, 'A', 'T', 40), Snv(5, 'A', 'G', 40)});
    ASSERT_EQ(variations.size(), 1u);
    EXPECT_EQ(variations[0], CodonVariation(1, TAG, CodonVariationType::MODIFICATION));
}

TEST(CodonEncoderTest, SynonymousChangeIsStillReported) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    auto variations = encoder.encode_snvs_as_codons({Snv(5, 'A', 'G', 40)});
    ASSERT_EQ(variations.size(), 1u);
    EXPECT_EQ(variations[0], CodonVariation(1, 2, CodonVariationType::MODIFICATION));
}

TEST(CodonEncoderTest, SeparatedSnvsEncodeIndependently) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    auto variations = encoder.encode_snvs_as_codons({Snv(0, 'A', 'C', 40), Snv(4, 'A', 'C', 40)});
    ASSERT_EQ(variations.size(), 2u);
    EXPECT_EQ(variations[0].codon_id, 0);
    EXPECT_EQ(variations[1], CodonVariation(1, ACA, CodonVariationType::MODIFICATION));
}

// ============================================================================
// Codon counts
// ============================================================================

TEST(CodonEncoderTest, WildCountsOnlyWhollyCoveredCodons) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    encoder.report_wild_codon_counts(Interval(1, 9));

    const auto& counts = encoder.codon_counts();
    EXPECT_EQ(counts.row(0).sum(), 0);
    EXPECT_EQ(counts(1, AAA), 1);
    EXPECT_EQ(counts(2, TAG), 1);
}

TEST(CodonEncoderTest, VariantCountsMixReferenceAndVariantCodons) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    encoder.report_variant_codon_counts(Interval(0, 9),
                                        {CodonVariation(1, ACA, CodonVariationType::MODIFICATION)});

    const auto& counts = encoder.codon_counts();
    EXPECT_EQ(counts(0, ATG), 1);
    EXPECT_EQ(counts(1, ACA), 1);
    EXPECT_EQ(counts(1, AAA), 0);
    EXPECT_EQ(counts(2, TAG), 1);
}

TEST(CodonEncoderTest, IndelsUseFramePreservingColumn) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    encoder.report_variant_codon_counts(Interval(0, 9),
                                        {CodonVariation(1, CCC, CodonVariationType::INSERTION),
                                         CodonVariation(1, -1, CodonVariationType::DELETION)});

    const auto& counts = encoder.codon_counts();
    EXPECT_EQ(counts(1, FRAME_PRESERVING_INDEL_INDEX), 1);
    EXPECT_EQ(counts(1, FRAME_SHIFTING_INDEL_INDEX), 0);
    EXPECT_EQ(counts.row(1).sum(), 1);
}

TEST(CodonEncoderTest, FrameshiftWinsOverInFrameIndel) {
    CodonEncoder encoder("1-9", SIMPLE_REF);
    encoder.report_variant_codon_counts(Interval(0, 9),
                                        {CodonVariation(1, -1, CodonVariationType::DELETION),
                                         CodonVariation(1, 0, CodonVariationType::FRAMESHIFT)});

    EXPECT_EQ(encoder.codon_counts()(1, FRAME_SHIFTING_INDEL_INDEX), 1);
    EXPECT_EQ(encoder.codon_counts()(1, FRAME_PRESERVING_INDEL_INDEX), 0);
}

TEST(CodonEncoderTest, MergeCounts) {
    CodonEncoder left("1-9", SIMPLE_REF);
    CodonEncoder right("1-9", SIMPLE_REF);
    left.report_wild_codon_counts(Interval(0, 9));
    right.report_wild_codon_counts(Interval(0, 9));

    left.merge_counts(right);
    EXPECT_EQ(left.codon_counts()(1, AAA), 2);

    CodonEncoder other("1-6", "ATGAAA");
    EXPECT_THROW(left.merge_counts(other), InternalError);
}
