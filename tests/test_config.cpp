#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

#include "core/Config.hpp"
#include "utils/ArgParser.hpp"

using namespace MiteSeq;

// Helper to create dummy files
void create_dummy_file(const std::string& path) {
    std::ofstream ofs(path);
    ofs << "dummy content";
    ofs.close();
}

TEST(ConfigTest, ValidationFailureMissingFiles) {
    Config config;
    // Reads, reference, ORF and prefix are required
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, ValidationFailureUnreadableInputs) {
    Config config;
    create_dummy_file("reads.bam");
    create_dummy_file("amplicon.fa");

    config.bam_path = "reads.bam";
    config.reference_fasta_path = "amplicon.fa";
    config.orf_coords = "1-9";
    config.output_file_prefix = "out";

    // Not valid BAM/FASTA files, htslib should fail
    EXPECT_FALSE(config.validate());

    std::remove("reads.bam");
    std::remove("amplicon.fa");
    std::remove("amplicon.fa.fai");
}

TEST(ConfigTest, ValidationFailureBadTranslation) {
    Config config;
    config.codon_translation = "KNKN";
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, ValidationFailureMissingOutputDirectory) {
    Config config;
    config.output_file_prefix = "no_such_directory/run1";
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, OutputPathAppendsSuffix) {
    Config config;
    config.output_file_prefix = "results/run1";
    EXPECT_EQ(config.output_path("codonCounts"), "results/run1.codonCounts");
}

TEST(ConfigTest, PrintListsThresholds) {
    Config config;
    config.orf_coords = "134-180,214-238";
    std::ostringstream oss;
    config.print(oss);
    EXPECT_NE(oss.str().find("ORF: 134-180,214-238"), std::string::npos);
    EXPECT_NE(oss.str().find("Min Flanking Length: 18"), std::string::npos);
    EXPECT_NE(oss.str().find("Paired Mode: yes"), std::string::npos);
}

// ============================================================================
// ArgParser
// ============================================================================

class ArgParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        // CLI11::ExistingFile checks for them
        create_dummy_file("r.bam");
        create_dummy_file("r.fa");
    }

    void TearDown() override {
        std::remove("r.bam");
        std::remove("r.fa");
    }
};

TEST_F(ArgParserTest, ParseArgumentsShortOptions) {
    Config config;
    const char* argv[] = {"program", "-b", "r.bam", "-r", "r.fa", "--orf", "1-9", "-O", "out", "-j", "4"};
    int argc = 11;

    bool result = Utils::ArgParser::parse(argc, const_cast<char**>(argv), config);

    EXPECT_TRUE(result);
    EXPECT_EQ(config.bam_path, "r.bam");
    EXPECT_EQ(config.reference_fasta_path, "r.fa");
    EXPECT_EQ(config.orf_coords, "1-9");
    EXPECT_EQ(config.output_file_prefix, "out");
    EXPECT_EQ(config.threads, 4);

    EXPECT_EQ(config.min_q, 30);
    EXPECT_EQ(config.min_length, 15);
    EXPECT_EQ(config.min_flanking_length, 18);
    EXPECT_EQ(config.min_variant_observations, 0);
    EXPECT_EQ(config.codon_translation, CodonTranslation::DEFAULT_TRANSLATION);
    EXPECT_TRUE(config.paired_mode);
    EXPECT_EQ(config.log_level, LogLevel::LOG_INFO);
}

TEST_F(ArgParserTest, ParseArgumentsLongOptions) {
    Config config;
    const char* argv[] = {"program",       "--bam",           "r.bam", "--reference",           "r.fa",
                          "--orf",         "134-180,214-238", "--output-file-prefix", "out", "--min-q",
                          "20",            "--min-length",    "10",    "--min-flanking-length", "5",
                          "--min-variant-obs", "2",           "--no-paired-mode", "--log-level", "DEBUG"};
    int argc = 20;

    bool result = Utils::ArgParser::parse(argc, const_cast<char**>(argv), config);

    EXPECT_TRUE(result);
    EXPECT_EQ(config.orf_coords, "134-180,214-238");
    EXPECT_EQ(config.min_q, 20);
    EXPECT_EQ(config.min_length, 10);
    EXPECT_EQ(config.min_flanking_length, 5);
    EXPECT_EQ(config.min_variant_observations, 2);
    EXPECT_FALSE(config.paired_mode);
    EXPECT_EQ(config.log_level, LogLevel::LOG_DEBUG);
    EXPECT_TRUE(config.is_debug());
}

TEST_F(ArgParserTest, RejectsShortTranslation) {
    Config config;
    const char* argv[] = {"program", "-b", "r.bam", "-r", "r.fa", "--orf", "1-9", "-O", "out",
                          "--codon-translation", "KNKN"};
    int argc = 11;

    EXPECT_FALSE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config));
}

TEST_F(ArgParserTest, RejectsMissingOrf) {
    Config config;
    const char* argv[] = {"program", "-b", "r.bam", "-r", "r.fa", "-O", "out"};
    int argc = 7;

    EXPECT_FALSE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config));
}

TEST_F(ArgParserTest, MinVariantObservationsTakesLongValues) {
    Config config;
    const char* argv[] = {"program", "-b", "r.bam", "-r", "r.fa", "--orf", "1-9", "-O", "out",
                          "--min-variant-obs", "5000000000"};
    int argc = 11;

    ASSERT_TRUE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config));
    EXPECT_EQ(config.min_variant_observations, 5000000000LL);
}
