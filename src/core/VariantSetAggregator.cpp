#include "core/VariantSetAggregator.hpp"

#include <algorithm>

namespace MiteSeq {

VariantSetAggregator::VariantSetAggregator(size_t expected_signatures) {
    if (expected_signatures > 0) {
        signatures_.reserve(expected_signatures);
    }
}

const SignatureStats& VariantSetAggregator::record(const SnvList& snvs, int32_t ref_coverage) {
    auto itr = signatures_.find(snvs);
    if (itr == signatures_.end()) {
        itr = signatures_.emplace(snvs, SignatureStats()).first;
    }
    SignatureStats& stats = itr->second;
    stats.count += 1;
    stats.total_ref_coverage += ref_coverage;
    return stats;
}

bool VariantSetAggregator::signature_less(const SnvList& lhs, const SnvList& rhs) {
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

std::vector<const VariantSetAggregator::Entry*> VariantSetAggregator::entries(int64_t min_count) const {
    std::vector<const Entry*> result;
    for (const auto& entry : signatures_) {
        if (entry.second.count >= min_count) {
            result.push_back(&entry);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Entry* lhs, const Entry* rhs) { return signature_less(lhs->first, rhs->first); });
    return result;
}

void VariantSetAggregator::merge(const VariantSetAggregator& other) {
    for (const auto& entry : other.signatures_) {
        SignatureStats& stats = signatures_.try_emplace(entry.first).first->second;
        stats.count += entry.second.count;
        stats.total_ref_coverage += entry.second.total_ref_coverage;
    }
}

const SignatureStats* VariantSetAggregator::find(const SnvList& snvs) const {
    auto itr = signatures_.find(snvs);
    return itr == signatures_.end() ? nullptr : &itr->second;
}

}  // namespace MiteSeq
