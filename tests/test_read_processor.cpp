#include <gtest/gtest.h>

#include <string>

#include "core/Errors.hpp"
#include "core/ReadProcessor.hpp"

using namespace MiteSeq;

namespace {

// ATG AAA TAG
const std::string REF = "ATGAAATAG";

AlignedRead make_read(const std::string& name, int32_t start, std::vector<CigarElement> cigar,
                      const std::string& bases, bool paired = true) {
    AlignedRead read;
    read.name = name;
    read.is_mapped = true;
    read.is_paired = paired;
    read.start = start;
    read.cigar = std::move(cigar);
    read.bases = bases;
    read.quals.assign(bases.size(), 40);
    return read;
}

AlignedRead full_read(const std::string& name, bool paired = true) {
    return make_read(name, 0, {{'M', 9}}, REF, paired);
}

}  // namespace

class ReadProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.orf_coords = "1-9";
        config.min_q = 30;
        config.min_length = 5;
        config.min_flanking_length = 2;
        config.paired_mode = true;
    }

    Config config;
};

// ============================================================================
// Pairing
// ============================================================================

TEST_F(ReadProcessorTest, AgreeingMatesFormOneMolecule) {
    ReadProcessor processor(REF, config);
    processor.process_read(full_read("pair"));
    processor.process_read(full_read("pair"));
    processor.finish();

    const ReadCounts& counts = processor.aggregator().counts();
    EXPECT_EQ(counts.reads_total, 2);
    EXPECT_EQ(counts.total_base_calls, 18);
    EXPECT_EQ(counts.wild_type_molecules, 1);
    EXPECT_EQ(counts.total_molecules(), 1);
    EXPECT_EQ(processor.unmated_reads(), 0);
}

TEST_F(ReadProcessorTest, DisagreeingMatesAreInconsistent) {
    ReadProcessor processor(REF, config);
    processor.process_read(make_read("pair", 0, {{'M', 9}}, "ATGACATAG"));
    processor.process_read(full_read("pair"));
    processor.finish();

    const ReadCounts& counts = processor.aggregator().counts();
    EXPECT_EQ(counts.inconsistent_pairs, 1);
    EXPECT_EQ(counts.total_molecules(), 1);
    EXPECT_EQ(processor.aggregator().ref_coverage()[0], 1);
}

TEST_F(ReadProcessorTest, MatesSharingAVariantAreCalled) {
    ReadProcessor processor(REF, config);
    processor.process_read(make_read("pair", 0, {{'M', 9}}, "ATGACATAG"));
    processor.process_read(make_read("pair", 0, {{'M', 9}}, "ATGACATAG"));
    processor.finish();

    EXPECT_EQ(processor.aggregator().counts().called_variant_molecules, 1);
    EXPECT_NE(processor.aggregator().variant_counts().find({Snv(4, 'A', 'C', 0)}), nullptr);
}

TEST_F(ReadProcessorTest, OrphanIsProcessedAlone) {
    ReadProcessor processor(REF, config);
    processor.process_read(full_read("orphan"));
    processor.process_read(full_read("pair"));
    processor.process_read(full_read("pair"));
    processor.finish();

    EXPECT_EQ(processor.unmated_reads(), 1);
    EXPECT_EQ(processor.reads_processed(), 3);
    EXPECT_EQ(processor.aggregator().counts().wild_type_molecules, 2);
}

TEST_F(ReadProcessorTest, FinishFlushesTrailingRead) {
    ReadProcessor processor(REF, config);
    processor.process_read(full_read("last"));
    EXPECT_EQ(processor.aggregator().counts().total_molecules(), 0);

    processor.finish();
    EXPECT_EQ(processor.aggregator().counts().wild_type_molecules, 1);
    EXPECT_EQ(processor.unmated_reads(), 1);

    processor.finish();
    EXPECT_EQ(processor.aggregator().counts().wild_type_molecules, 1);
}

TEST_F(ReadProcessorTest, DisjointMatesAreSeparateMolecules) {
    config.min_length = 3;
    ReadProcessor processor(REF, config);
    processor.process_read(make_read("pair", 0, {{'M', 4}}, "ATGA"));
    processor.process_read(make_read("pair", 5, {{'M', 4}}, "ATAG"));
    processor.finish();

    EXPECT_EQ(processor.aggregator().counts().wild_type_molecules, 2);
    const auto& codons = processor.aggregator().codon_encoder().codon_counts();
    EXPECT_EQ(codons(0, 14), 1);
    EXPECT_EQ(codons.row(1).sum(), 0);
    EXPECT_EQ(codons(2, 50), 1);
}

TEST_F(ReadProcessorTest, UnpairedModeTreatsEveryReadAlone) {
    config.paired_mode = false;
    ReadProcessor processor(REF, config);
    processor.process_read(full_read("pair"));
    processor.process_read(full_read("pair"));

    EXPECT_EQ(processor.aggregator().counts().wild_type_molecules, 2);
    EXPECT_EQ(processor.unmated_reads(), 0);
}

TEST_F(ReadProcessorTest, UnpairedReadIsNotHeldBack) {
    ReadProcessor processor(REF, config);
    processor.process_read(full_read("single", false));
    EXPECT_EQ(processor.aggregator().counts().wild_type_molecules, 1);
}

// ============================================================================
// Read filtering
// ============================================================================

TEST_F(ReadProcessorTest, UnmappedReadIsCountedOnly) {
    ReadProcessor processor(REF, config);
    AlignedRead read = full_read("unmapped", false);
    read.is_mapped = false;
    processor.process_read(read);

    const ReadCounts& counts = processor.aggregator().counts();
    EXPECT_EQ(counts.reads_total, 1);
    EXPECT_EQ(counts.reads_unmapped, 1);
    EXPECT_EQ(counts.total_molecules(), 0);
}

TEST_F(ReadProcessorTest, LowQualityReadIsCountedOnly) {
    ReadProcessor processor(REF, config);
    AlignedRead read = full_read("noisy", false);
    read.quals.assign(read.bases.size(), 10);
    processor.process_read(read);

    const ReadCounts& counts = processor.aggregator().counts();
    EXPECT_EQ(counts.reads_low_quality, 1);
    EXPECT_EQ(counts.total_molecules(), 0);
}

TEST_F(ReadProcessorTest, FailuresNameTheRead) {
    ReadProcessor processor(REF, config);
    AlignedRead read = make_read("clipped", 0, {{'H', 2}, {'M', 9}}, REF, false);

    try {
        processor.process_read(read);
        FAIL() << "Expected InternalError";
    } catch (const InternalError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Caught unexpected exception on read 1: clipped: ", 0), 0u);
    }
}

TEST_F(ReadProcessorTest, InvalidOrfIsRejected) {
    config.orf_coords = "1-8";
    EXPECT_THROW({ ReadProcessor processor(REF, config); }, UserError);
}
