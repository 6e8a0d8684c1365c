#pragma once

#include <htslib/sam.h>

#include "core/DataStructs.hpp"

namespace MiteSeq {

/**
 * @brief Converts BAM records into AlignedRead.
 *
 * Only the primary line of each read is kept: secondary and supplementary records
 * are dropped, unmapped records pass so they can be counted.
 *
 * Thread-safe: This class is stateless and can be used from multiple threads.
 */
class ReadParser {
public:
    /**
     * @brief True unless the record is a secondary or supplementary alignment.
     */
    static bool should_keep(const bam1_t* b);

    /**
     * @brief Copies name, flags, position, CIGAR, bases and qualities of a record.
     *
     * Bases are decoded from the 4-bit encoding; a missing quality string (0xff)
     * becomes quality 0 for every base.
     */
    static AlignedRead parse(const bam1_t* b);
};

}  // namespace MiteSeq
