#include "core/MoleculeAggregator.hpp"

#include <algorithm>

#include "core/Errors.hpp"

namespace MiteSeq {

MoleculeAggregator::MoleculeAggregator(const std::string& ref_seq, const std::string& orf_coords,
                                       const MoleculeFilterConfig& config)
    : config_(config),
      codon_encoder_(orf_coords, ref_seq),
      span_counter_(static_cast<int32_t>(ref_seq.size())),
      ref_coverage_(ref_seq.size(), 0),
      coverage_size_histogram_(ref_seq.size() + 1, 0) {
}

void MoleculeAggregator::note_read(int32_t read_length, bool is_mapped) {
    counts_.reads_total += 1;
    counts_.total_base_calls += read_length;
    if (!is_mapped) {
        counts_.reads_unmapped += 1;
    }
}

void MoleculeAggregator::note_low_quality_read() {
    counts_.reads_low_quality += 1;
}

bool MoleculeAggregator::has_low_quality_variation(const SnvList& variations) const {
    static const std::string CALLABLE = "-ACGT";
    return std::any_of(variations.begin(), variations.end(), [this](const Snv& snv) {
        return snv.quality < config_.min_q || CALLABLE.find(snv.variant_call) == std::string::npos;
    });
}

bool MoleculeAggregator::has_insufficient_flank(const SnvList& variations, const Interval& span) const {
    return span.end - variations.back().ref_index < config_.min_flanking_length ||
           variations.front().ref_index - span.start < config_.min_flanking_length;
}

MoleculeCategory MoleculeAggregator::apply_report(const ReadReport& report) {
    if (report.empty()) {
        return MoleculeCategory::EMPTY;
    }

    for (const auto& interval : report.ref_coverage) {
        for (int32_t idx = interval.start; idx != interval.end; ++idx) {
            ref_coverage_[idx] += 1;
        }
    }
    const int32_t covered_bases = report.covered_bases();
    coverage_size_histogram_[covered_bases] += 1;

    const Interval span = report.total_span();
    span_counter_.add_count(span.start, span.end);

    if (!report.variations) {
        counts_.inconsistent_pairs += 1;
        return MoleculeCategory::INCONSISTENT_PAIR;
    }

    const SnvList& variations = *report.variations;
    if (variations.empty()) {
        counts_.wild_type_molecules += 1;
        if (report.ref_coverage.size() != 1) {
            throw InternalError("expecting a single coverage interval for a wild-type molecule");
        }
        codon_encoder_.report_wild_codon_counts(report.ref_coverage.front());
        return MoleculeCategory::WILD_TYPE;
    }

    if (has_low_quality_variation(variations)) {
        counts_.low_quality_variant_molecules += 1;
        return MoleculeCategory::LOW_QUALITY_VARIANT;
    }

    if (has_insufficient_flank(variations, span)) {
        counts_.insufficient_flank_molecules += 1;
        return MoleculeCategory::INSUFFICIENT_FLANK;
    }

    counts_.called_variant_molecules += 1;
    codon_encoder_.report_variant_codon_counts(span, codon_encoder_.encode_snvs_as_codons(variations));
    variant_counts_.record(variations, covered_bases);
    return MoleculeCategory::CALLED_VARIANT;
}

void MoleculeAggregator::merge(const MoleculeAggregator& other) {
    if (other.ref_coverage_.size() != ref_coverage_.size()) {
        throw InternalError("can't merge aggregations over references of different lengths");
    }
    codon_encoder_.merge_counts(other.codon_encoder_);
    span_counter_.merge(other.span_counter_);
    variant_counts_.merge(other.variant_counts_);
    counts_.merge(other.counts_);
    for (size_t idx = 0; idx < ref_coverage_.size(); ++idx) {
        ref_coverage_[idx] += other.ref_coverage_[idx];
    }
    for (size_t idx = 0; idx < coverage_size_histogram_.size(); ++idx) {
        coverage_size_histogram_[idx] += other.coverage_size_histogram_[idx];
    }
}

}  // namespace MiteSeq
