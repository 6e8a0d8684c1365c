#include "core/CodonEncoder.hpp"

#include <sstream>
#include <stdexcept>

#include "core/CodonTranslation.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace MiteSeq {

namespace {

constexpr int START_CODON = 0x0E;  // ATG
constexpr int STOP_OCH = 0x30;     // TAA
constexpr int STOP_AMB = 0x32;     // TAG
constexpr int STOP_OPA = 0x38;     // TGA

int32_t parse_coordinate(const std::string& text, const std::string& orf_coords) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw UserError("Can't interpret ORF coords as integers: " + orf_coords);
    }
    if (consumed != text.size()) {
        throw UserError("Can't interpret ORF coords as integers: " + orf_coords);
    }
    return value;
}

int checked_base_value(char base) {
    int value = CodonTranslation::base_value(base);
    if (value < 0) {
        throw InternalError(std::string("can't encode non-ACGT call in a codon: ") + base);
    }
    return value;
}

}  // namespace

CodonEncoder::CodonEncoder(const std::string& orf_coords, std::string ref_seq)
    : ref_seq_(std::move(ref_seq)),
      exons_(parse_exons(orf_coords, static_cast<int32_t>(ref_seq_.size()))),
      ref_codon_values_(parse_reference_into_codons()),
      codon_counts_(CodonCountTable::Zero(static_cast<Eigen::Index>(ref_codon_values_.size()), CODON_COUNT_ROW_SIZE)) {
    std::stringstream ss;
    ss << "ORF has " << (exons_.size() - 1) << " exon(s) and " << ref_codon_values_.size() << " codons";
    LOG_INFO(ss.str());
}

std::vector<Interval> CodonEncoder::parse_exons(const std::string& orf_coords, int32_t ref_length) {
    std::vector<Interval> exons;

    std::stringstream pairs(orf_coords);
    std::string coord_pair;
    while (std::getline(pairs, coord_pair, ',')) {
        const size_t dash = coord_pair.find('-');
        if (dash == std::string::npos || coord_pair.find('-', dash + 1) != std::string::npos) {
            throw UserError("Can't interpret ORF as list of pairs of coords: " + orf_coords);
        }
        const int32_t start = parse_coordinate(coord_pair.substr(0, dash), orf_coords);
        if (start < 1) {
            throw UserError("Coordinates of ORF are 1-based.");
        }
        const int32_t end = parse_coordinate(coord_pair.substr(dash + 1), orf_coords);
        if (end < start) {
            throw UserError("Found ORF end coordinate less than start: " + orf_coords);
        }
        if (end > ref_length) {
            throw UserError("ORF coordinates extend beyond the end of the reference: " + orf_coords);
        }
        // 1-based, inclusive -> 0-based, half-open
        exons.emplace_back(start - 1, end);
        if (exons.size() > 1 && exons[exons.size() - 2].end >= exons.back().start) {
            throw UserError("ORF coordinates are not sorted: " + orf_coords);
        }
    }
    if (exons.empty()) {
        throw UserError("Can't interpret ORF as list of pairs of coords: " + orf_coords);
    }

    int64_t orf_length = 0;
    for (const auto& exon : exons) {
        orf_length += exon.size();
    }
    if (orf_length % 3 != 0) {
        throw UserError("ORF length must be divisible by 3.");
    }

    // zero-length sentinel: every exon walk can look one exon ahead
    exons.emplace_back(INFINITE_POSITION, INFINITE_POSITION);

    return exons;
}

bool CodonEncoder::is_stop(int codon_value) {
    return codon_value == STOP_OCH || codon_value == STOP_AMB || codon_value == STOP_OPA;
}

std::vector<int> CodonEncoder::parse_reference_into_codons() const {
    int32_t orf_length = 0;
    for (const auto& exon : exons_) {
        orf_length += exon.size();
    }
    const int n_codons = orf_length / 3;

    std::vector<int> codon_values(n_codons, 0);
    int codon_id = 0;
    int codon_phase = 0;
    int codon_value = 0;
    for (size_t exon_idx = 0; exon_idx + 1 < exons_.size(); ++exon_idx) {
        const Interval& exon = exons_[exon_idx];
        for (int32_t ref_index = exon.start; ref_index != exon.end; ++ref_index) {
            const int base = CodonTranslation::base_value(ref_seq_[ref_index]);
            if (base < 0) {
                throw UserError("Reference sequence contains something other than A, C, G, and T.");
            }
            codon_value = (codon_value << 2) | base;
            if (++codon_phase == 3) {
                if (is_stop(codon_value) && codon_id != n_codons - 1) {
                    throw UserError("There is an upstream stop codon at reference index " +
                                    std::to_string(ref_index + 1) + ".");
                }
                codon_values[codon_id++] = codon_value;
                codon_value = 0;
                codon_phase = 0;
            }
        }
    }

    if (codon_values.front() != START_CODON) {
        LOG_WARNING("Your ORF does not start with the expected ATG codon.");
    }
    if (!is_stop(codon_values.back())) {
        LOG_WARNING("Your ORF does not end with the expected stop codon.");
    }

    return codon_values;
}

bool CodonEncoder::is_exonic(int32_t ref_index) const {
    for (const auto& exon : exons_) {
        if (exon.start > ref_index) return false;
        if (exon.end > ref_index) return true;
    }
    // the sentinel always stops the loop above
    throw InternalError("exon list is missing its sentinel");
}

int32_t CodonEncoder::exonic_base_count(int32_t ref_index) const {
    int32_t base_count = 0;
    for (const auto& exon : exons_) {
        if (ref_index >= exon.end) {
            base_count += exon.size();
        } else {
            if (ref_index > exon.start) {
                base_count += ref_index - exon.start;
            }
            break;
        }
    }
    return base_count;
}

CodonEncoder::CodonWalkState CodonEncoder::start_walk(int32_t ref_index) const {
    CodonWalkState state;
    state.ref_index = ref_index;
    while (exons_[state.exon_idx].end <= ref_index) {
        ++state.exon_idx;
    }
    if (exons_[state.exon_idx].start > ref_index) {
        throw InternalError("can't find current exon, even though refIndex should be exonic.");
    }

    const int32_t exonic_bases = exonic_base_count(ref_index);
    state.codon_id = exonic_bases / 3;
    state.codon_phase = exonic_bases % 3;

    // seed with the reference bases of the codon that precede ref_index
    const int ref_value = ref_codon_values_[state.codon_id];
    if (state.codon_phase == 0) {
        state.codon_value = 0;
    } else if (state.codon_phase == 1) {
        state.codon_value = ref_value >> 4;
    } else {
        state.codon_value = ref_value >> 2;
    }
    state.lead_lag = 0;
    return state;
}

std::vector<CodonVariation> CodonEncoder::encode_snvs_as_codons(const SnvList& snvs) const {
    std::vector<CodonVariation> codon_variations;
    const int n_codons = num_codons();
    const int32_t ref_length = static_cast<int32_t>(ref_seq_.size());

    auto snv_itr = snvs.begin();
    auto next_exonic_snv = [&]() -> const Snv* {
        while (snv_itr != snvs.end()) {
            const Snv& candidate = *snv_itr++;
            if (is_exonic(candidate.ref_index)) {
                return &candidate;
            }
        }
        return nullptr;
    };

    const Snv* snv = next_exonic_snv();
    while (snv) {
        CodonWalkState state = start_walk(snv->ref_index);
        do {
            bool codon_value_altered = false;
            bool bump_ref_index = false;
            if (!snv || snv->ref_index != state.ref_index) {
                state.codon_value = (state.codon_value << 2) | checked_base_value(ref_seq_[state.ref_index]);
                codon_value_altered = true;
                bump_ref_index = true;
            } else {
                if (snv->is_deletion()) {
                    if (--state.lead_lag == -3) {
                        codon_variations.emplace_back(state.codon_id, -1, CodonVariationType::DELETION);
                        if (++state.codon_id == n_codons) {
                            return codon_variations;
                        }
                        state.lead_lag = 0;
                    }
                    bump_ref_index = true;
                } else if (snv->is_insertion()) {
                    state.lead_lag += 1;
                    state.codon_value = (state.codon_value << 2) | checked_base_value(snv->variant_call);
                    codon_value_altered = true;
                } else {
                    state.codon_value = (state.codon_value << 2) | checked_base_value(snv->variant_call);
                    codon_value_altered = true;
                    bump_ref_index = true;
                }
                snv = next_exonic_snv();
            }

            if (bump_ref_index) {
                if (++state.ref_index == exons_[state.exon_idx].end) {
                    ++state.exon_idx;
                    if (exons_[state.exon_idx].start != INFINITE_POSITION) {
                        state.ref_index = exons_[state.exon_idx].start;
                    }
                }
                if (state.ref_index == ref_length) {
                    return codon_variations;
                }
            }

            if (codon_value_altered && ++state.codon_phase == 3) {
                if (state.lead_lag == 3) {
                    codon_variations.emplace_back(state.codon_id, state.codon_value, CodonVariationType::INSERTION);
                    state.lead_lag = 0;
                    // an inserted codon does not use up a reference codon
                    state.codon_id -= 1;
                } else if (state.codon_value != ref_codon_values_[state.codon_id]) {
                    codon_variations.emplace_back(state.codon_id, state.codon_value,
                                                  CodonVariationType::MODIFICATION);
                }
                if (is_stop(state.codon_value)) {
                    return codon_variations;
                }
                if (++state.codon_id == n_codons) {
                    return codon_variations;
                }
                state.codon_phase = 0;
                state.codon_value = 0;
            }
        } while (state.lead_lag != 0 || state.codon_phase != 0);
    }

    return codon_variations;
}

std::pair<int, int> CodonEncoder::contained_codon_range(const Interval& ref_coverage) const {
    const int starting_codon_id = (exonic_base_count(ref_coverage.start) + 2) / 3;
    const int ending_codon_id = exonic_base_count(ref_coverage.end) / 3;
    return {starting_codon_id, ending_codon_id};
}

void CodonEncoder::report_wild_codon_counts(const Interval& ref_coverage) {
    const auto [starting_codon_id, ending_codon_id] = contained_codon_range(ref_coverage);
    for (int codon_id = starting_codon_id; codon_id < ending_codon_id; ++codon_id) {
        codon_counts_(codon_id, ref_codon_values_[codon_id]) += 1;
    }
}

void CodonEncoder::report_variant_codon_counts(const Interval& ref_coverage,
                                               const std::vector<CodonVariation>& variations) {
    const auto [starting_codon_id, ending_codon_id] = contained_codon_range(ref_coverage);
    constexpr int NO_INDEL = -1;

    auto variation = variations.begin();
    for (int codon_id = starting_codon_id; codon_id < ending_codon_id; ++codon_id) {
        while (variation != variations.end() && variation->codon_id < codon_id) {
            ++variation;
        }
        if (variation == variations.end() || variation->codon_id != codon_id) {
            codon_counts_(codon_id, ref_codon_values_[codon_id]) += 1;
            continue;
        }

        // at most one indel column per codon; frame-shifting wins
        int indel_column = NO_INDEL;
        do {
            switch (variation->type) {
                case CodonVariationType::FRAMESHIFT:
                    indel_column = FRAME_SHIFTING_INDEL_INDEX;
                    break;
                case CodonVariationType::DELETION:
                case CodonVariationType::INSERTION:
                    if (indel_column == NO_INDEL) indel_column = FRAME_PRESERVING_INDEL_INDEX;
                    break;
                case CodonVariationType::MODIFICATION:
                    codon_counts_(codon_id, variation->codon_value) += 1;
                    break;
            }
            ++variation;
        } while (variation != variations.end() && variation->codon_id == codon_id);

        if (indel_column != NO_INDEL) {
            codon_counts_(codon_id, indel_column) += 1;
        }
    }
}

void CodonEncoder::merge_counts(const CodonEncoder& other) {
    if (other.exons_ != exons_ || other.codon_counts_.rows() != codon_counts_.rows()) {
        throw InternalError("can't merge codon counts of different ORFs");
    }
    codon_counts_ += other.codon_counts_;
}

}  // namespace MiteSeq
