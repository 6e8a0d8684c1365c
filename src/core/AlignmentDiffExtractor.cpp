#include "core/AlignmentDiffExtractor.hpp"

#include <cctype>
#include <utility>

#include "core/Errors.hpp"

namespace MiteSeq {

namespace {

inline bool is_match_operator(char op) {
    return op == 'M' || op == '=' || op == 'X' || op == 'S';
}

}  // namespace

AlignmentDiffExtractor::AlignmentDiffExtractor(std::string ref_seq) : ref_seq_(std::move(ref_seq)) {
}

bool AlignmentDiffExtractor::is_supported_operator(char op) {
    return is_match_operator(op) || op == 'I' || op == 'D';
}

ReadReport AlignmentDiffExtractor::extract(const AlignedRead& read, const Interval& trim) const {
    const auto& cigar = read.cigar;
    const int32_t ref_len = static_cast<int32_t>(ref_seq_.size());

    size_t cigar_idx = 0;
    char op = 0;
    int64_t op_remaining = 0;

    // Loads the next non-empty CIGAR element into op/op_remaining.
    auto next_element = [&]() {
        while (cigar_idx < cigar.size() && cigar[cigar_idx].length == 0) {
            ++cigar_idx;
        }
        if (cigar_idx == cigar.size()) {
            throw InternalError("unexpectedly exhausted cigar iterator");
        }
        op = cigar[cigar_idx].op;
        op_remaining = cigar[cigar_idx].length;
        ++cigar_idx;
        if (!is_supported_operator(op)) {
            throw InternalError(std::string("unanticipated cigar operator: ") + op);
        }
    };

    next_element();

    int32_t ref_index = read.start;
    int32_t read_index = 0;

    // pretend that a leading soft clip is a match
    if (op == 'S') {
        ref_index -= static_cast<int32_t>(op_remaining);
    }

    SnvList variations;
    std::vector<Interval> coverage;
    int32_t coverage_begin = -1;
    int32_t coverage_end = -1;

    while (ref_index < ref_len) {
        if (read_index >= trim.start && ref_index >= 0) {
            if (coverage_begin == -1) {
                coverage_begin = ref_index;
                coverage_end = ref_index;
            }
            const char ref_call = ref_seq_[ref_index];
            if (op == 'D') {
                // a deletion has no call of its own, borrow the quality of the next base
                variations.emplace_back(ref_index, ref_call, NO_CALL, read.quals[read_index]);
            } else {
                const char call = static_cast<char>(std::toupper(static_cast<unsigned char>(read.bases[read_index])));
                if (op == 'I') {
                    variations.emplace_back(ref_index, NO_CALL, call, read.quals[read_index]);
                } else {
                    if (call != ref_call) {
                        variations.emplace_back(ref_index, ref_call, call, read.quals[read_index]);
                    }
                    if (ref_index == coverage_end) {
                        ++coverage_end;
                    } else {
                        // a run opened by a leading deletion is empty and is dropped
                        if (coverage_begin < coverage_end) {
                            coverage.emplace_back(coverage_begin, coverage_end);
                        }
                        coverage_begin = ref_index;
                        coverage_end = ref_index + 1;
                    }
                }
            }
        }

        if (op != 'D') {
            if (++read_index == trim.end) {
                break;
            }
        }
        if (op != 'I') {
            if (++ref_index == ref_len) {
                break;
            }
        }
        if (--op_remaining == 0) {
            next_element();
        }
    }

    if (coverage_begin < coverage_end) {
        coverage.emplace_back(coverage_begin, coverage_end);
    }

    return ReadReport(std::move(coverage), std::move(variations));
}

}  // namespace MiteSeq
