#pragma once

#include <cstdint>
#include <vector>

namespace MiteSeq {

/**
 * @brief Counts molecules by the [start, end) they span on the reference.
 *
 * Stored as a triangular table indexed first by start and then by span length, so
 * that the number of molecules wholly containing any interval can be recovered later.
 * Queries cost O(ref_length^2) in the worst case and are meant to be made once per
 * reported variant, not per read.
 */
class IntervalSpanCounter {
public:
    explicit IntervalSpanCounter(int32_t ref_length);

    /**
     * @brief Records one molecule spanning [ref_start, ref_end).
     */
    void add_count(int32_t ref_start, int32_t ref_end);

    /**
     * @brief Number of recorded molecules with start <= ref_start and end >= ref_end.
     *
     * Arguments may fall outside the reference (e.g. after subtracting a flank); nothing
     * can span such an interval on the outside.
     */
    int64_t count_spanners(int32_t ref_start, int32_t ref_end) const;

    /**
     * @brief Adds the counts of another counter over the same reference.
     */
    void merge(const IntervalSpanCounter& other);

private:
    int32_t ref_length_;
    std::vector<std::vector<int64_t>> counts_;  ///< counts_[start][length]
};

}  // namespace MiteSeq
