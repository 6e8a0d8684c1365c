#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "core/CodonTranslation.hpp"
#include "core/Config.hpp"
#include "core/DataStructs.hpp"
#include "core/MoleculeAggregator.hpp"

namespace MiteSeq {

/**
 * @brief Settings that shape the reports but not the aggregation.
 */
struct ReportOptions {
    int64_t min_variant_observations = 0;  ///< Signatures seen fewer times are left out of variantCounts
    int min_length = 15;                   ///< First row of coverageLengthCounts
    int num_threads = 1;                   ///< Threads for the spanning-molecule queries
};

/**
 * @brief Writes the eight run reports from a finished aggregation.
 *
 * Every report is written to <prefix>.<suffix>:
 * ```
 * prefix.variantCounts          # one line per variant signature
 * prefix.refCoverage            # molecules covering each reference position
 * prefix.codonCounts            # codon x observed-codon counts
 * prefix.codonFractions         # the same as percentages of each row
 * prefix.aaCounts               # codon x amino-acid counts
 * prefix.aaFractions            # the same as percentages
 * prefix.readCounts             # read and molecule tallies
 * prefix.coverageLengthCounts   # molecules by covered length
 * ```
 * Each write_* method formats one report onto a stream; write_all() opens the files.
 */
class ReportWriter {
public:
    ReportWriter(const MoleculeAggregator& aggregator, const CodonTranslation& translation,
                 const ReportOptions& options = {});

    /**
     * @brief Writes every report to config.output_path(suffix).
     * @throws UserError "Can't write <path>" if a file can't be created or written.
     */
    void write_all(const Config& config) const;

    /**
     * @brief Per signature (signature order, count >= min_variant_observations):
     * count, spanning molecules, summed quality, mean coverage, SNVs, codon and amino-acid changes.
     */
    void write_variant_counts(std::ostream& os) const;

    void write_ref_coverage(std::ostream& os) const;
    void write_codon_counts(std::ostream& os) const;
    void write_codon_fractions(std::ostream& os) const;
    void write_aa_counts(std::ostream& os) const;
    void write_aa_fractions(std::ostream& os) const;
    void write_read_counts(std::ostream& os) const;
    void write_coverage_length_counts(std::ostream& os) const;

    /**
     * @brief Codon changes of one signature: the non-frameshift count, then "id:REF>ALT"
     * labels, then amino-acid labels, each list tab-led and comma-separated.
     */
    void describe_variants_as_codons(std::ostream& os, const SnvList& snvs) const;

    /**
     * @brief Number of molecules spanning the flanked region of each signature, computed in parallel.
     */
    std::vector<int64_t> count_signature_spanners(const std::vector<const SnvList*>& signatures) const;

private:
    using ReportMethod = void (ReportWriter::*)(std::ostream&) const;

    void write_file(const std::string& path, ReportMethod method) const;

    static std::string format_percent(int64_t count, int64_t total);

    const MoleculeAggregator& aggregator_;
    const CodonTranslation& translation_;
    ReportOptions options_;
};

}  // namespace MiteSeq
