#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Types.hpp"

namespace MiteSeq {

/**
 * @brief Half-open interval [start, end) on a single coordinate axis (reference or read-local).
 */
struct Interval {
    int32_t start = 0;
    int32_t end = 0;

    Interval() = default;
    Interval(int32_t s, int32_t e) : start(s), end(e) {}

    int32_t size() const { return end - start; }
    bool empty() const { return start == end; }

    bool operator==(const Interval& other) const { return start == other.start && end == other.end; }
    bool operator!=(const Interval& other) const { return !(*this == other); }
};

/**
 * @brief A single-base deviation from the reference.
 *
 * Equality, ordering and hashing consider (ref_index, ref_call, variant_call) only;
 * quality is carried along but never part of the identity.
 */
struct Snv {
    int32_t ref_index = 0;   ///< 0-based reference position
    char ref_call = NO_CALL;      ///< Reference base, NO_CALL for an insertion
    char variant_call = NO_CALL;  ///< Observed base, NO_CALL for a deletion
    uint8_t quality = 0;     ///< Phred quality of the supporting call

    Snv() = default;
    Snv(int32_t index, char ref, char variant, uint8_t qual)
        : ref_index(index), ref_call(ref), variant_call(variant), quality(qual) {}

    bool is_insertion() const { return ref_call == NO_CALL; }
    bool is_deletion() const { return variant_call == NO_CALL; }

    bool operator==(const Snv& other) const {
        return ref_index == other.ref_index && ref_call == other.ref_call && variant_call == other.variant_call;
    }
    bool operator!=(const Snv& other) const { return !(*this == other); }

    bool operator<(const Snv& other) const {
        if (ref_index != other.ref_index) return ref_index < other.ref_index;
        if (ref_call != other.ref_call) return ref_call < other.ref_call;
        return variant_call < other.variant_call;
    }

    /**
     * @brief 1-based description, e.g. "4:A>C".
     */
    std::string to_string() const;
};

using SnvList = std::vector<Snv>;

struct SnvHash {
    size_t operator()(const Snv& snv) const {
        return 47 * (47 * (47 * static_cast<size_t>(snv.ref_index) + static_cast<unsigned char>(snv.ref_call)) +
                     static_cast<unsigned char>(snv.variant_call));
    }
};

/**
 * @brief Structural hash of an ordered SNV array (quality ignored).
 */
struct SnvListHash {
    size_t operator()(const SnvList& snvs) const {
        SnvHash snv_hash;
        size_t hash = 0;
        for (const auto& snv : snvs) {
            hash = 47 * hash + snv_hash(snv);
        }
        return 47 * hash;
    }
};

/**
 * @brief Reference coverage and variations of one read or one reconciled pair.
 *
 * `variations` is absent (std::nullopt) when two mates disagree inside their overlap:
 * the coverage still counts, the variations do not.
 */
struct ReadReport {
    std::vector<Interval> ref_coverage;  ///< Disjoint, ascending
    std::optional<SnvList> variations;   ///< Ascending by ref_index

    ReadReport() : variations(SnvList{}) {}
    ReadReport(std::vector<Interval> coverage, std::optional<SnvList> snvs)
        : ref_coverage(std::move(coverage)), variations(std::move(snvs)) {}

    bool empty() const { return ref_coverage.empty(); }

    /// Overall span from the first interval's start to the last interval's end.
    Interval total_span() const {
        if (ref_coverage.empty()) return Interval();
        return Interval(ref_coverage.front().start, ref_coverage.back().end);
    }

    /// Number of reference bases actually covered.
    int32_t covered_bases() const {
        int32_t total = 0;
        for (const auto& interval : ref_coverage) {
            total += interval.size();
        }
        return total;
    }
};

/**
 * @brief A codon-level change relative to the reference ORF.
 */
struct CodonVariation {
    int codon_id = 0;     ///< 0-based codon index within the ORF
    int codon_value = 0;  ///< Packed codon (0..63), -1 for a pure deletion
    CodonVariationType type = CodonVariationType::MODIFICATION;

    CodonVariation() = default;
    CodonVariation(int id, int value, CodonVariationType t) : codon_id(id), codon_value(value), type(t) {}

    bool is_frameshift() const { return type == CodonVariationType::FRAMESHIFT; }
    bool is_insertion() const { return type == CodonVariationType::INSERTION; }
    bool is_deletion() const { return type == CodonVariationType::DELETION; }
    bool is_modification() const { return type == CodonVariationType::MODIFICATION; }

    bool operator==(const CodonVariation& other) const {
        return codon_id == other.codon_id && codon_value == other.codon_value && type == other.type;
    }
};

/**
 * @brief One CIGAR operation ('M', 'I', 'D', 'N', 'S', 'H', 'P', '=', 'X') and its length.
 */
struct CigarElement {
    char op;
    uint32_t length;
};

/**
 * @brief Alignment record as consumed by the pipeline, independent of htslib.
 */
struct AlignedRead {
    std::string name;                ///< QNAME
    bool is_mapped = false;          ///< False if BAM_FUNMAP is set
    bool is_paired = false;          ///< BAM_FPAIRED
    int32_t start = 0;               ///< 0-based alignment start
    std::vector<CigarElement> cigar;
    std::string bases;               ///< Base calls in read orientation as stored in the BAM
    std::vector<uint8_t> quals;      ///< Phred qualities, same length as bases

    int32_t length() const { return static_cast<int32_t>(bases.size()); }
};

/**
 * @brief Run-wide read and molecule counters.
 *
 * The molecule counts are mutually exclusive; their sum is the number of molecules.
 */
struct ReadCounts {
    int64_t reads_total = 0;        ///< Reads seen (primary alignments, mapped or not)
    int64_t reads_unmapped = 0;
    int64_t reads_low_quality = 0;  ///< Reads whose trim interval was empty
    int64_t total_base_calls = 0;   ///< Base calls over all reads

    int64_t inconsistent_pairs = 0;
    int64_t wild_type_molecules = 0;
    int64_t insufficient_flank_molecules = 0;
    int64_t low_quality_variant_molecules = 0;
    int64_t called_variant_molecules = 0;

    int64_t total_molecules() const {
        return inconsistent_pairs + wild_type_molecules + insufficient_flank_molecules +
               low_quality_variant_molecules + called_variant_molecules;
    }

    void merge(const ReadCounts& other) {
        reads_total += other.reads_total;
        reads_unmapped += other.reads_unmapped;
        reads_low_quality += other.reads_low_quality;
        total_base_calls += other.total_base_calls;
        inconsistent_pairs += other.inconsistent_pairs;
        wild_type_molecules += other.wild_type_molecules;
        insufficient_flank_molecules += other.insufficient_flank_molecules;
        low_quality_variant_molecules += other.low_quality_variant_molecules;
        called_variant_molecules += other.called_variant_molecules;
    }
};

}  // namespace MiteSeq
