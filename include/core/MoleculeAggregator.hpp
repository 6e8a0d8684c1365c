#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/CodonEncoder.hpp"
#include "core/DataStructs.hpp"
#include "core/IntervalSpanCounter.hpp"
#include "core/VariantSetAggregator.hpp"

namespace MiteSeq {

/**
 * @brief Thresholds that decide how a molecule is classified.
 */
struct MoleculeFilterConfig {
    int min_q = 30;                ///< Minimum quality of every called variation
    int min_flanking_length = 18;  ///< Minimum wild-type coverage on either side of the variations
};

/**
 * @brief All run-wide aggregation state.
 *
 * Every molecule report is classified into exactly one MoleculeCategory and folded into:
 * - per-position reference coverage and the coverage-size histogram,
 * - the span table (IntervalSpanCounter),
 * - the codon count table (CodonEncoder),
 * - the variant signature counts (VariantSetAggregator),
 * - the read/molecule counters (ReadCounts).
 *
 * Aggregators built over the same reference and ORF can be merged; the result equals
 * a single aggregator fed all reports.
 */
class MoleculeAggregator {
public:
    MoleculeAggregator(const std::string& ref_seq, const std::string& orf_coords,
                       const MoleculeFilterConfig& config = {});

    /**
     * @brief Classifies one molecule report and folds it into the tables.
     *
     * @throws InternalError if a wild-type molecule has more than one coverage interval.
     */
    MoleculeCategory apply_report(const ReadReport& report);

    /// Counts one primary read of the given length.
    void note_read(int32_t read_length, bool is_mapped);

    /// Counts one read whose trim interval came out empty.
    void note_low_quality_read();

    void merge(const MoleculeAggregator& other);

    const ReadCounts& counts() const { return counts_; }
    const CodonEncoder& codon_encoder() const { return codon_encoder_; }
    const IntervalSpanCounter& span_counter() const { return span_counter_; }
    const VariantSetAggregator& variant_counts() const { return variant_counts_; }
    const std::vector<int64_t>& ref_coverage() const { return ref_coverage_; }
    const std::vector<int64_t>& coverage_size_histogram() const { return coverage_size_histogram_; }
    const MoleculeFilterConfig& config() const { return config_; }

private:
    bool has_low_quality_variation(const SnvList& variations) const;
    bool has_insufficient_flank(const SnvList& variations, const Interval& span) const;

    MoleculeFilterConfig config_;
    CodonEncoder codon_encoder_;
    IntervalSpanCounter span_counter_;
    VariantSetAggregator variant_counts_;
    ReadCounts counts_;
    std::vector<int64_t> ref_coverage_;             ///< Molecules covering each reference position
    std::vector<int64_t> coverage_size_histogram_;  ///< Molecules by number of covered bases
};

}  // namespace MiteSeq
