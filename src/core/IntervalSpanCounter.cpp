#include "core/IntervalSpanCounter.hpp"

#include <algorithm>
#include <string>

#include "core/Errors.hpp"

namespace MiteSeq {

IntervalSpanCounter::IntervalSpanCounter(int32_t ref_length) : ref_length_(ref_length), counts_(ref_length) {
    for (int32_t row = 0; row < ref_length_; ++row) {
        counts_[row].assign(ref_length_ - row + 1, 0);
    }
}

void IntervalSpanCounter::add_count(int32_t ref_start, int32_t ref_end) {
    if (ref_start < 0 || ref_end < ref_start || ref_end > ref_length_ || ref_start >= ref_length_) {
        throw InternalError("molecule span [" + std::to_string(ref_start) + ", " + std::to_string(ref_end) +
                            ") lies outside the reference");
    }
    counts_[ref_start][ref_end - ref_start] += 1;
}

int64_t IntervalSpanCounter::count_spanners(int32_t ref_start, int32_t ref_end) const {
    int64_t total = 0;
    const int32_t last_row = std::min(ref_start, ref_length_ - 1);
    for (int32_t row = 0; row <= last_row; ++row) {
        const auto& spans = counts_[row];
        const int32_t n_spans = static_cast<int32_t>(spans.size());
        for (int32_t span = std::max(ref_end - row, 0); span < n_spans; ++span) {
            total += spans[span];
        }
    }
    return total;
}

void IntervalSpanCounter::merge(const IntervalSpanCounter& other) {
    if (other.ref_length_ != ref_length_) {
        throw InternalError("can't merge span counts over references of different lengths");
    }
    for (int32_t row = 0; row < ref_length_; ++row) {
        auto& spans = counts_[row];
        const auto& other_spans = other.counts_[row];
        for (size_t span = 0; span < spans.size(); ++span) {
            spans[span] += other_spans[span];
        }
    }
}

}  // namespace MiteSeq
