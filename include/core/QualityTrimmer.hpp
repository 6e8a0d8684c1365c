#pragma once

#include <cstdint>
#include <vector>

#include "core/DataStructs.hpp"

namespace MiteSeq {

/**
 * @brief Finds the high-quality portion of a read.
 *
 * The portion starts at the first run of `min_length` consecutive calls with
 * quality >= `min_q` and ends after the last such run. A read with no such run
 * yields an empty interval; reads are never trimmed inside a low-quality stretch.
 *
 * Stateless apart from its thresholds, safe to share.
 */
class QualityTrimmer {
public:
    QualityTrimmer(int min_q, int min_length);

    /**
     * @brief Computes the trim interval for a read.
     *
     * @param quals Per-base phred qualities.
     * @return Read-local [start, end), or an empty interval if no qualifying run exists.
     */
    Interval calculate_trim(const std::vector<uint8_t>& quals) const;

private:
    int min_q_;
    int min_length_;
};

}  // namespace MiteSeq
