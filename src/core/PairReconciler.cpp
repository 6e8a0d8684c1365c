#include "core/PairReconciler.hpp"

#include <algorithm>

namespace MiteSeq {

PairMergeResult PairReconciler::combine_reports(const ReadReport& report1, const ReadReport& report2) {
    PairMergeResult result;

    // a mate with no coverage contributes nothing
    if (report1.empty()) {
        result.outcome = PairOutcome::MERGED;
        result.report = report2;
        return result;
    }
    if (report2.empty()) {
        result.outcome = PairOutcome::MERGED;
        result.report = report1;
        return result;
    }

    const auto& coverage1 = report1.ref_coverage;
    const auto& coverage2 = report2.ref_coverage;
    const int32_t overlap_start = std::max(coverage1.front().start, coverage2.front().start);
    const int32_t overlap_end = std::min(coverage1.back().end, coverage2.back().end);
    if (overlap_end < overlap_start) {
        result.outcome = PairOutcome::APPLY_SEPARATELY;
        return result;
    }

    std::vector<Interval> combined_coverage = combine_intervals(coverage1, coverage2);

    std::optional<SnvList> combined_snvs;
    if (report1.variations && report2.variations) {
        combined_snvs = combine_snvs(*report1.variations, *report2.variations, overlap_start, overlap_end);
    }

    result.outcome = combined_snvs ? PairOutcome::MERGED : PairOutcome::INCONSISTENT;
    result.report = ReadReport(std::move(combined_coverage), std::move(combined_snvs));
    return result;
}

std::vector<Interval> PairReconciler::combine_intervals(const std::vector<Interval>& coverage1,
                                                        const std::vector<Interval>& coverage2) {
    std::vector<Interval> combined;
    if (coverage1.empty()) return coverage2;
    if (coverage2.empty()) return coverage1;
    combined.reserve(coverage1.size() + coverage2.size());

    auto itr1 = coverage1.begin();
    auto itr2 = coverage2.begin();

    // Takes the interval with the lower start from either list.
    auto next_interval = [&]() -> Interval {
        if (itr1 == coverage1.end()) return *itr2++;
        if (itr2 == coverage2.end()) return *itr1++;
        if (itr1->start < itr2->start) return *itr1++;
        return *itr2++;
    };

    Interval current = next_interval();
    while (itr1 != coverage1.end() || itr2 != coverage2.end()) {
        const Interval test = next_interval();
        if (current.end < test.start) {
            combined.push_back(current);
            current = test;
        } else {
            current.end = std::max(current.end, test.end);
        }
    }
    combined.push_back(current);

    return combined;
}

std::optional<SnvList> PairReconciler::combine_snvs(const SnvList& snvs1, const SnvList& snvs2, int32_t overlap_start,
                                                    int32_t overlap_end) {
    auto in_overlap = [overlap_start, overlap_end](int32_t ref_index) {
        return ref_index >= overlap_start && ref_index < overlap_end;
    };

    SnvList combined;
    combined.reserve(std::max(snvs1.size(), snvs2.size()));

    auto itr1 = snvs1.begin();
    auto itr2 = snvs2.begin();
    while (itr1 != snvs1.end() || itr2 != snvs2.end()) {
        if (itr1 == snvs1.end() || (itr2 != snvs2.end() && itr2->ref_index < itr1->ref_index)) {
            // only the second mate calls this one
            if (in_overlap(itr2->ref_index)) return std::nullopt;
            combined.push_back(*itr2++);
        } else if (itr2 == snvs2.end() || itr1->ref_index < itr2->ref_index) {
            if (in_overlap(itr1->ref_index)) return std::nullopt;
            combined.push_back(*itr1++);
        } else if (*itr1 != *itr2) {
            return std::nullopt;
        } else {
            combined.push_back(itr1->quality > itr2->quality ? *itr1 : *itr2);
            ++itr1;
            ++itr2;
        }
    }

    return combined;
}

}  // namespace MiteSeq
