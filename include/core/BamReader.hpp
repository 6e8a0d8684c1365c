#pragma once

#include <htslib/sam.h>

#include <cstdint>
#include <string>

namespace MiteSeq {

/**
 * @brief RAII wrapper for streaming every record of a SAM/BAM/CRAM file with HTSlib.
 *
 * Records come back in file order; no index is needed. Mates are expected to be
 * adjacent (name-grouped input).
 *
 * Usage:
 *   BamReader reader("reads.bam");
 *   bam1_t* b = bam_init1();
 *   while (reader.next(b)) { ... }
 *   bam_destroy1(b);
 */
class BamReader {
public:
    /**
     * @brief Opens the file and reads its header.
     * @param bam_path Path to the reads file.
     * @param n_threads Number of BGZF decompression threads (default 1).
     * @throws UserError if the file or its header cannot be read.
     */
    explicit BamReader(const std::string& bam_path, int n_threads = 1);

    ~BamReader();

    // Disable copy, allow move
    BamReader(const BamReader&) = delete;
    BamReader& operator=(const BamReader&) = delete;
    BamReader(BamReader&&) noexcept;
    BamReader& operator=(BamReader&&) noexcept;

    /**
     * @brief Reads the next record into b.
     * @return false at end of file.
     * @throws UserError if the file is truncated or corrupt.
     */
    bool next(bam1_t* b);

    const sam_hdr_t* get_header() const { return hdr_; }

    bool is_open() const { return fp_ != nullptr; }

    const std::string& get_path() const { return bam_path_; }

    /// Records returned by next() so far.
    int64_t records_read() const { return records_read_; }

private:
    void close();

    std::string bam_path_;
    samFile* fp_;
    sam_hdr_t* hdr_;
    int64_t records_read_ = 0;
};

}  // namespace MiteSeq
