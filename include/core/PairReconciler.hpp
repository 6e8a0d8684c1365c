#pragma once

#include <vector>

#include "core/DataStructs.hpp"

namespace MiteSeq {

/**
 * @brief Result of reconciling two mates.
 *
 * - MERGED: `report` is the combined molecule.
 * - INCONSISTENT: `report` carries the combined coverage and no variations.
 * - APPLY_SEPARATELY: `report` is empty; the caller applies each mate's report on its own.
 */
struct PairMergeResult {
    PairOutcome outcome = PairOutcome::APPLY_SEPARATELY;
    ReadReport report;
};

/**
 * @brief Merges the reports of the two mates of one molecule.
 *
 * The overlap is computed from the outer bounds of each mate's coverage. Inside the
 * overlap both mates must call exactly the same variations; outside it each mate's
 * calls stand.
 */
class PairReconciler {
public:
    static PairMergeResult combine_reports(const ReadReport& report1, const ReadReport& report2);

    /**
     * @brief Union of two sorted interval lists; touching or overlapping intervals coalesce.
     */
    static std::vector<Interval> combine_intervals(const std::vector<Interval>& coverage1,
                                                   const std::vector<Interval>& coverage2);

    /**
     * @brief Ordered merge of two SNV lists.
     *
     * @return The merged list, or std::nullopt if the lists disagree anywhere in
     *         [overlap_start, overlap_end).
     */
    static std::optional<SnvList> combine_snvs(const SnvList& snvs1, const SnvList& snvs2, int32_t overlap_start,
                                               int32_t overlap_end);
};

}  // namespace MiteSeq
