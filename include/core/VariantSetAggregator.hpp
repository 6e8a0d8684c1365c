#pragma once

#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/DataStructs.hpp"

namespace MiteSeq {

/**
 * @brief Observation count and summed reference coverage of one variant signature.
 */
struct SignatureStats {
    int64_t count = 0;               ///< Molecules observed with exactly this SNV set
    int64_t total_ref_coverage = 0;  ///< Covered bases summed over those molecules

    double mean_ref_coverage() const {
        return count ? static_cast<double>(total_ref_coverage) / count : 0.0;
    }
};

/**
 * @brief Deduplicates and counts the distinct SNV sets ("variant signatures") of all molecules.
 *
 * Keys compare and hash structurally, ignoring SNV quality; the stored key keeps the
 * qualities of its first observation.
 */
class VariantSetAggregator {
public:
    using SignatureMap = std::unordered_map<SnvList, SignatureStats, SnvListHash>;
    using Entry = SignatureMap::value_type;

    explicit VariantSetAggregator(size_t expected_signatures = 0);

    /**
     * @brief Counts one molecule with the given SNV set.
     *
     * The list is copied only when the signature is new; a known one is bumped in place.
     *
     * @return The statistics of the signature after the update.
     */
    const SignatureStats& record(const SnvList& snvs, int32_t ref_coverage);

    /**
     * @brief Entries observed at least min_count times, in signature order.
     *
     * Signatures compare SNV by SNV; when one is a prefix of the other the shorter comes first.
     * The pointers stay valid until the aggregator is modified.
     */
    std::vector<const Entry*> entries(int64_t min_count = 0) const;

    /**
     * @brief Adds every signature of another aggregator into this one.
     */
    void merge(const VariantSetAggregator& other);

    size_t size() const { return signatures_.size(); }

    /**
     * @brief Statistics for a signature, or nullptr if it was never recorded.
     */
    const SignatureStats* find(const SnvList& snvs) const;

    static bool signature_less(const SnvList& lhs, const SnvList& rhs);

private:
    SignatureMap signatures_;
};

}  // namespace MiteSeq
