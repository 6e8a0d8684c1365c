#pragma once

#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "core/DataStructs.hpp"

namespace MiteSeq {

/**
 * @brief Per-codon observation counts: one row per ORF codon, columns 0..63 for the
 * codon values, then the frame-preserving and frame-shifting indel columns.
 */
using CodonCountTable = Eigen::Matrix<int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Codon model of the ORF under study.
 *
 * Holds the exon list, the reference value of every codon (codons may straddle an
 * exon/intron junction), and the codon count table that molecules are tallied into.
 */
class CodonEncoder {
public:
    /**
     * @brief Builds the model from ORF coordinates and the reference.
     *
     * @param orf_coords Comma-separated "start-end" pairs, 1-based and inclusive,
     *                   e.g. "134-180,214-238".
     * @param ref_seq Upper-cased ACGT reference.
     * @throws UserError on malformed or unsorted coordinates, an ORF length not divisible
     *         by 3, coordinates beyond the reference, or a premature stop codon.
     */
    CodonEncoder(const std::string& orf_coords, std::string ref_seq);

    /**
     * @brief Parses ORF coordinates into 0-based half-open exons plus an infinite sentinel.
     */
    static std::vector<Interval> parse_exons(const std::string& orf_coords, int32_t ref_length);

    /**
     * @brief True for TAA, TAG and TGA.
     */
    static bool is_stop(int codon_value);

    /**
     * @brief Translates an ascending SNV list into codon-level variations.
     *
     * Non-exonic SNVs are skipped. Encoding stops at a stop codon or at the end of the ORF.
     */
    std::vector<CodonVariation> encode_snvs_as_codons(const SnvList& snvs) const;

    /**
     * @brief Counts the reference value of every codon wholly inside the coverage interval.
     */
    void report_wild_codon_counts(const Interval& ref_coverage);

    /**
     * @brief Counts every codon wholly inside the coverage interval according to the variations
     * that touch it.
     *
     * @param variations Codon variations in ascending codon order, as produced by
     *                   encode_snvs_as_codons().
     */
    void report_variant_codon_counts(const Interval& ref_coverage, const std::vector<CodonVariation>& variations);

    /**
     * @brief Adds another encoder's counts into this one (same ORF required).
     */
    void merge_counts(const CodonEncoder& other);

    bool is_exonic(int32_t ref_index) const;

    /**
     * @brief Number of ORF bases strictly before ref_index.
     */
    int32_t exonic_base_count(int32_t ref_index) const;

    int num_codons() const { return static_cast<int>(ref_codon_values_.size()); }
    const std::vector<int>& ref_codon_values() const { return ref_codon_values_; }
    const std::vector<Interval>& exons() const { return exons_; }
    const CodonCountTable& codon_counts() const { return codon_counts_; }

private:
    /// Scratch state of one codon walk, reset for every run of linked SNVs.
    struct CodonWalkState {
        int32_t ref_index = 0;
        size_t exon_idx = 0;
        int codon_id = 0;
        int codon_phase = 0;
        int codon_value = 0;
        int lead_lag = 0;  ///< Inserted minus deleted bases in the current codon
    };

    std::vector<int> parse_reference_into_codons() const;
    CodonWalkState start_walk(int32_t ref_index) const;
    std::pair<int, int> contained_codon_range(const Interval& ref_coverage) const;

    std::string ref_seq_;
    std::vector<Interval> exons_;
    std::vector<int> ref_codon_values_;
    CodonCountTable codon_counts_;
};

}  // namespace MiteSeq
