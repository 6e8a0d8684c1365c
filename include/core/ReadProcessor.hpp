#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>

#include "core/AlignmentDiffExtractor.hpp"
#include "core/Config.hpp"
#include "core/DataStructs.hpp"
#include "core/MoleculeAggregator.hpp"
#include "core/PairReconciler.hpp"
#include "core/QualityTrimmer.hpp"

namespace MiteSeq {

/**
 * @brief Streams reads in file order and feeds molecule reports to the aggregator.
 *
 * Each read is trimmed (QualityTrimmer) and compared against the reference
 * (AlignmentDiffExtractor). In paired mode a paired read is held back until the
 * next read arrives: if that read carries the same name the two reports are
 * reconciled (PairReconciler) into one molecule, otherwise the held read is
 * processed on its own. Unpaired reads are always processed on their own.
 *
 * finish() must be called after the last read so a held read is not lost.
 */
class ReadProcessor {
public:
    /**
     * @throws UserError on an invalid ORF or min_length.
     */
    ReadProcessor(const std::string& ref_seq, const Config& config);

    /**
     * @brief Counts the read and returns its report.
     *
     * Unmapped reads and reads whose quality window is shorter than min_length
     * produce an empty report.
     */
    ReadReport get_read_report(const AlignedRead& read);

    /**
     * @brief Consumes the next primary read.
     *
     * @throws InternalError wrapping any failure as
     *         "Caught unexpected exception on read N: NAME: cause".
     */
    void process_read(const AlignedRead& read);

    /**
     * @brief Processes a read still waiting for its mate.
     */
    void finish();

    /**
     * @brief Runs every primary record of a SAM/BAM/CRAM file through process_read(), then finish().
     *
     * @param n_threads BGZF decompression threads.
     * @return Number of records read from the file.
     */
    int64_t process_bam(const std::string& bam_path, int n_threads = 1);

    const MoleculeAggregator& aggregator() const { return aggregator_; }

    /// Reads handed to process_read() so far.
    int64_t reads_processed() const { return read_ordinal_; }

    /// Paired reads whose neighbor did not carry the same name.
    int64_t unmated_reads() const { return unmated_reads_; }

private:
    void apply_solo(const AlignedRead& read);
    void apply(const ReadReport& report);
    [[noreturn]] void rethrow_for_read(int64_t ordinal, const std::string& name, const std::exception& e) const;

    bool paired_mode_;
    QualityTrimmer trimmer_;
    AlignmentDiffExtractor extractor_;
    MoleculeAggregator aggregator_;

    std::optional<AlignedRead> pending_mate_;
    int64_t pending_ordinal_ = 0;
    int64_t read_ordinal_ = 0;
    int64_t unmated_reads_ = 0;
};

}  // namespace MiteSeq
