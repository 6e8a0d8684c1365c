#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace MiteSeq {

/// Marks the missing side of an indel SNV (ref_call of an insertion, variant_call of a deletion).
constexpr char NO_CALL = '-';

/// Number of distinct packed codon values (2 bits per base, 3 bases).
constexpr int N_REGULAR_CODONS = 64;
constexpr int FRAME_PRESERVING_INDEL_INDEX = 64;
constexpr int FRAME_SHIFTING_INDEL_INDEX = 65;
constexpr int CODON_COUNT_ROW_SIZE = 66;

/// Bound used by the terminal exon sentinel.
constexpr int32_t INFINITE_POSITION = std::numeric_limits<int32_t>::max();

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,  ///< Only errors
    LOG_WARN = 1,   ///< Errors and warnings
    LOG_INFO = 2,   ///< Normal operational messages
    LOG_DEBUG = 3   ///< Detailed debug output including per-read diagnostics
};

/**
 * @brief Kind of codon-level change produced by the codon encoder.
 */
enum class CodonVariationType : uint8_t {
    FRAMESHIFT,
    INSERTION,
    DELETION,
    MODIFICATION
};

/**
 * @brief Outcome of reconciling the reports of two mates.
 */
enum class PairOutcome : uint8_t {
    MERGED,            ///< One consistent molecule report
    APPLY_SEPARATELY,  ///< Mates do not overlap; each report stands on its own
    INCONSISTENT       ///< Mates disagree inside the overlap; coverage only
};

/**
 * @brief Mutually exclusive classification of a molecule report.
 */
enum class MoleculeCategory : uint8_t {
    EMPTY = 0,            ///< No reference coverage, ignored
    INCONSISTENT_PAIR,    ///< Mates disagree in their overlap
    WILD_TYPE,            ///< No variation from reference
    LOW_QUALITY_VARIANT,  ///< A variation was called with low quality
    INSUFFICIENT_FLANK,   ///< A variation is too close to the edge of coverage
    CALLED_VARIANT        ///< At least one trusted variation
};

inline std::string molecule_category_to_string(MoleculeCategory category) {
    switch (category) {
        case MoleculeCategory::EMPTY: return "EMPTY";
        case MoleculeCategory::INCONSISTENT_PAIR: return "INCONSISTENT_PAIR";
        case MoleculeCategory::WILD_TYPE: return "WILD_TYPE";
        case MoleculeCategory::LOW_QUALITY_VARIANT: return "LOW_QUALITY_VARIANT";
        case MoleculeCategory::INSUFFICIENT_FLANK: return "INSUFFICIENT_FLANK";
        case MoleculeCategory::CALLED_VARIANT: return "CALLED_VARIANT";
        default: return "UNKNOWN";
    }
}

}  // namespace MiteSeq
