#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <string>

#include "core/Config.hpp"
#include "utils/Logger.hpp"

namespace MiteSeq {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"mite_seq - Codon-level variant counting for MITE-seq saturation mutagenesis reads"};

        // Input/Output
        app.add_option("-b,--bam", config.bam_path, "Aligned reads, SAM/BAM/CRAM (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-r,--reference", config.reference_fasta_path, "Single-contig reference FASTA (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("--orf", config.orf_coords,
                       "Exon coordinates of the ORF, 1-based inclusive, e.g. 134-180,214-238 (Required)")
            ->required();

        app.add_option("-O,--output-file-prefix", config.output_file_prefix,
                       "Prefix of the report files (Required)")
            ->required();

        // Filtering
        app.add_option("--min-q", config.min_q, "Minimum base quality (Default: 30)")
            ->check(CLI::Range(0, 93));

        app.add_option("--min-length", config.min_length,
                       "Minimum length of the high-quality read window (Default: 15)")
            ->check(CLI::PositiveNumber);

        app.add_option("--min-flanking-length", config.min_flanking_length,
                       "Minimum wild-type flank around the variations of a molecule (Default: 18)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--min-variant-obs", config.min_variant_observations,
                       "Minimum observations of a variant set to report it (Default: 0)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--codon-translation", config.codon_translation,
                       "Amino-acid letter of each of the 64 codons, AAA first (Default: standard code, Z=stop)")
            ->check([](const std::string& table) {
                return table.size() == static_cast<size_t>(N_REGULAR_CODONS)
                           ? std::string()
                           : "must have " + std::to_string(N_REGULAR_CODONS) + " letters";
            });

        app.add_flag("--paired-mode,!--no-paired-mode", config.paired_mode,
                     "Reconcile adjacent mates into one molecule (Default: enabled)");

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also append the log to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // help (ret=0) or an error (ret>0): CLI11 prints the message
            app.exit(e);
            return false;
        }

        std::string log_lower = log_level_str;
        std::transform(log_lower.begin(), log_lower.end(), log_lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        config.log_level = Logger::parse_level(log_lower);

        return true;
    }
};

}  // namespace Utils
}  // namespace MiteSeq
