#include "core/BamReader.hpp"

#include <utility>

#include "core/Errors.hpp"

namespace MiteSeq {

BamReader::BamReader(const std::string& bam_path, int n_threads) : bam_path_(bam_path), fp_(nullptr), hdr_(nullptr) {
    fp_ = sam_open(bam_path.c_str(), "r");
    if (!fp_) {
        throw UserError("Failed to open reads file: " + bam_path);
    }

    if (n_threads > 1) {
        if (hts_set_threads(fp_, n_threads) != 0) {
            sam_close(fp_);
            fp_ = nullptr;
            throw UserError("Failed to set threads for reads file: " + bam_path);
        }
    }

    hdr_ = sam_hdr_read(fp_);
    if (!hdr_) {
        sam_close(fp_);
        fp_ = nullptr;
        throw UserError("Failed to read header of reads file: " + bam_path);
    }
}

BamReader::~BamReader() {
    close();
}

void BamReader::close() {
    if (hdr_) sam_hdr_destroy(hdr_);
    if (fp_) sam_close(fp_);
    hdr_ = nullptr;
    fp_ = nullptr;
}

BamReader::BamReader(BamReader&& other) noexcept
    : bam_path_(std::move(other.bam_path_)), fp_(other.fp_), hdr_(other.hdr_), records_read_(other.records_read_) {
    other.fp_ = nullptr;
    other.hdr_ = nullptr;
}

BamReader& BamReader::operator=(BamReader&& other) noexcept {
    if (this != &other) {
        close();

        bam_path_ = std::move(other.bam_path_);
        fp_ = other.fp_;
        hdr_ = other.hdr_;
        records_read_ = other.records_read_;

        other.fp_ = nullptr;
        other.hdr_ = nullptr;
    }
    return *this;
}

bool BamReader::next(bam1_t* b) {
    if (!fp_ || !hdr_) {
        return false;
    }
    int ret = sam_read1(fp_, hdr_, b);
    if (ret >= 0) {
        records_read_ += 1;
        return true;
    }
    // -1 is a clean end of file
    if (ret < -1) {
        throw UserError("Error reading record " + std::to_string(records_read_ + 1) + " of " + bam_path_);
    }
    return false;
}

}  // namespace MiteSeq
