#include "core/QualityTrimmer.hpp"

#include "core/Errors.hpp"

namespace MiteSeq {

QualityTrimmer::QualityTrimmer(int min_q, int min_length) : min_q_(min_q), min_length_(min_length) {
    if (min_length_ < 1) {
        throw UserError("min-length must be positive, got " + std::to_string(min_length_));
    }
}

Interval QualityTrimmer::calculate_trim(const std::vector<uint8_t>& quals) const {
    const int32_t n_quals = static_cast<int32_t>(quals.size());

    // Leading trim: first index of the first qualifying run
    int32_t read_start = 0;
    int hi_q_count = 0;
    while (read_start < n_quals) {
        if (quals[read_start] < min_q_) {
            hi_q_count = 0;
        } else if (++hi_q_count == min_length_) {
            break;
        }
        ++read_start;
    }
    if (read_start == n_quals) {
        return Interval();
    }
    read_start -= min_length_ - 1;

    // Trailing trim: one past the last index of the last qualifying run.
    // The forward scan found a run, so this scan always finds one too.
    int32_t read_end = n_quals - 1;
    hi_q_count = 0;
    while (read_end >= 0) {
        if (quals[read_end] < min_q_) {
            hi_q_count = 0;
        } else if (++hi_q_count == min_length_) {
            break;
        }
        --read_end;
    }
    read_end += min_length_;

    return Interval(read_start, read_end);
}

}  // namespace MiteSeq
