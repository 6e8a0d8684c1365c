#pragma once

#include <htslib/faidx.h>

#include <cstdint>
#include <string>

namespace MiteSeq {

/**
 * @brief RAII wrapper for FASTA file reading with HTSlib.
 *
 * The reference of a MITE-seq run is a single amplicon contig; load_single_contig()
 * returns it whole, upper-cased and checked.
 *
 * Usage:
 *   FastaReader fasta("amplicon.fa");
 *   std::string ref = fasta.load_single_contig();
 */
class FastaReader {
public:
    /**
     * @brief Loads the FASTA index, building the .fai when it is missing.
     * @throws UserError if the file cannot be opened or indexed.
     */
    explicit FastaReader(const std::string& fasta_path);

    ~FastaReader();

    // Disable copy, allow move
    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;
    FastaReader(FastaReader&&) noexcept;
    FastaReader& operator=(FastaReader&&) noexcept;

    int num_sequences() const;

    /// Name of the i-th contig, empty if out of range.
    std::string sequence_name(int index) const;

    /**
     * @brief Fetches a whole contig, upper-cased.
     * @throws UserError if the contig is unknown.
     */
    std::string fetch_sequence(const std::string& chr) const;

    /**
     * @brief Returns the only contig of the file.
     * @throws UserError if the file holds zero or several contigs, or a base other than ACGT.
     */
    std::string load_single_contig() const;

    bool is_loaded() const { return fai_ != nullptr; }

    const std::string& get_path() const { return fasta_path_; }

private:
    std::string fasta_path_;
    faidx_t* fai_;
};

}  // namespace MiteSeq
