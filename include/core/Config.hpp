#pragma once

#include <iostream>
#include <string>

#include "Types.hpp"
#include "core/CodonTranslation.hpp"

namespace MiteSeq {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Stores paths to input/output files and the molecule filtering thresholds.
 * Validated by both CLI11 (basic checks) and internal validate() method (complex logic).
 */
struct Config {
    // Input/Output
    std::string bam_path;              ///< Aligned reads, SAM/BAM/CRAM (Required)
    std::string reference_fasta_path;  ///< Single-contig reference FASTA (Required)
    std::string orf_coords;            ///< 1-based inclusive exon list, e.g. "134-180,214-238" (Required)
    std::string output_file_prefix;    ///< Every report is written to <prefix>.<suffix> (Required)

    // Filtering
    int min_q = 30;                ///< Minimum base quality kept by trimming and for called variations
    int min_length = 15;           ///< Minimum length of the high-quality read window
    int min_flanking_length = 18;  ///< Minimum wild-type flank on each side of the variations
    int64_t min_variant_observations = 0;  ///< Signatures seen fewer times are omitted from variantCounts

    std::string codon_translation = CodonTranslation::DEFAULT_TRANSLATION;  ///< 64 amino-acid letters
    bool paired_mode = true;  ///< Reconcile adjacent mates into one molecule

    int threads = 1;  ///< BGZF decompression and report threads

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Optional copy of the log

    /**
     * @brief Validates configuration logic and input files.
     *
     * Performs checks that CLI11 cannot handle:
     * - Numeric relationships and the translation table length
     * - Opening the reads and reference through htslib
     * - Existence of the output prefix's directory
     *
     * Problems are reported on stderr.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print(std::ostream& os = std::cout) const;

    /**
     * @brief Path of one report file.
     */
    std::string output_path(const std::string& suffix) const { return output_file_prefix + "." + suffix; }

    bool is_debug() const { return log_level >= LogLevel::LOG_DEBUG; }
};

}  // namespace MiteSeq
