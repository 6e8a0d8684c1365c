#include "core/CodonTranslation.hpp"

#include "core/Errors.hpp"
#include "core/Types.hpp"

namespace MiteSeq {

const std::string CodonTranslation::DEFAULT_TRANSLATION =
    "KNKNTTTTRSRSIIMIQHQHPPPPRRRRLLLLEDEDAAAAGGGGVVVVZYZYSSSSZCWCLFLF";

CodonTranslation::CodonTranslation(const std::string& translation) : translation_(translation) {
    if (translation_.size() != static_cast<size_t>(N_REGULAR_CODONS)) {
        throw UserError("codon-translation string must contain exactly 64 characters, got " +
                        std::to_string(translation_.size()));
    }
    for (char aa : translation_) {
        column_for_aa_.emplace(aa, 0);
    }
    size_t column = 0;
    for (auto& entry : column_for_aa_) {
        entry.second = column++;
        amino_acids_.push_back(entry.first);
    }
}

std::vector<int64_t> CodonTranslation::collapse(
    const Eigen::Ref<const Eigen::Matrix<int64_t, 1, Eigen::Dynamic>>& row) const {
    std::vector<int64_t> aa_counts(amino_acids_.size(), 0);
    for (int codon_value = 0; codon_value < N_REGULAR_CODONS; ++codon_value) {
        aa_counts[column_for_aa_.at(translation_[codon_value])] += row(codon_value);
    }
    return aa_counts;
}

std::string CodonTranslation::codon_label(int codon_value) {
    static const char BASES[] = "ACGT";
    std::string label(3, 'N');
    label[0] = BASES[(codon_value >> 4) & 3];
    label[1] = BASES[(codon_value >> 2) & 3];
    label[2] = BASES[codon_value & 3];
    return label;
}

int CodonTranslation::base_value(char base) {
    switch (base) {
        case 'A': return 0;
        case 'C': return 1;
        case 'G': return 2;
        case 'T': return 3;
        default: return -1;
    }
}

}  // namespace MiteSeq
