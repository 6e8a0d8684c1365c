#pragma once

#include <string>

#include "core/DataStructs.hpp"

namespace MiteSeq {

/**
 * @brief Walks a read's CIGAR against the reference and reports what it covers and where it differs.
 *
 * Both a reference index and a read-local index are advanced according to the CIGAR:
 * - M, =, X and S consume both and are compared base for base (a leading soft clip is
 *   aligned as if it were matched, so the walk starts clip-length bases before the
 *   alignment start);
 * - I consumes the read only;
 * - D consumes the reference only.
 *
 * Only positions whose read index lies inside the trim interval are recorded. Coverage is
 * accumulated over contiguous matched reference positions.
 *
 * @throws InternalError for any other CIGAR operator, or if the CIGAR runs out before the
 *         trim interval or the reference does.
 */
class AlignmentDiffExtractor {
public:
    /**
     * @param ref_seq Upper-cased reference bases.
     */
    explicit AlignmentDiffExtractor(std::string ref_seq);

    /**
     * @brief Produces the report for one read.
     *
     * @param read The aligned read (must be mapped).
     * @param trim Read-local [start, end) from QualityTrimmer, non-empty.
     */
    ReadReport extract(const AlignedRead& read, const Interval& trim) const;

    /**
     * @brief True for the operators the walk knows how to follow.
     */
    static bool is_supported_operator(char op);

private:
    std::string ref_seq_;
};

}  // namespace MiteSeq
