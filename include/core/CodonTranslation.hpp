#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace MiteSeq {

/**
 * @brief Maps the 64 packed codon values (AAA=0, AAC=1, ... TTT=63) onto amino-acid codes.
 *
 * The default table uses 'Z' for the three stop codons.
 */
class CodonTranslation {
public:
    static const std::string DEFAULT_TRANSLATION;

    /**
     * @throws UserError if the table does not hold exactly 64 characters.
     */
    explicit CodonTranslation(const std::string& translation = DEFAULT_TRANSLATION);

    char translate(int codon_value) const { return translation_[codon_value]; }

    /**
     * @brief Distinct amino-acid codes in ascending order (the columns of the aa reports).
     */
    const std::vector<char>& amino_acids() const { return amino_acids_; }

    /**
     * @brief Sums the first 64 columns of a codon-count row per amino acid.
     *
     * @return One count per entry of amino_acids(), in the same order.
     */
    std::vector<int64_t> collapse(const Eigen::Ref<const Eigen::Matrix<int64_t, 1, Eigen::Dynamic>>& row) const;

    /**
     * @brief Three-letter label of a packed codon value, e.g. 14 -> "ATG".
     */
    static std::string codon_label(int codon_value);

    /**
     * @brief 2-bit value of a base (A=0, C=1, G=2, T=3), -1 for anything else.
     */
    static int base_value(char base);

private:
    std::string translation_;
    std::vector<char> amino_acids_;
    std::map<char, size_t> column_for_aa_;
};

}  // namespace MiteSeq
