#include "utils/FastaReader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace MiteSeq {

FastaReader::FastaReader(const std::string& fasta_path) : fasta_path_(fasta_path), fai_(nullptr) {
    fai_ = fai_load(fasta_path.c_str());
    if (!fai_) {
        throw UserError("Failed to load reference FASTA: " + fasta_path);
    }
}

FastaReader::~FastaReader() {
    if (fai_) {
        fai_destroy(fai_);
    }
}

FastaReader::FastaReader(FastaReader&& other) noexcept : fasta_path_(std::move(other.fasta_path_)), fai_(other.fai_) {
    other.fai_ = nullptr;
}

FastaReader& FastaReader::operator=(FastaReader&& other) noexcept {
    if (this != &other) {
        if (fai_) {
            fai_destroy(fai_);
        }
        fasta_path_ = std::move(other.fasta_path_);
        fai_ = other.fai_;
        other.fai_ = nullptr;
    }
    return *this;
}

int FastaReader::num_sequences() const {
    return fai_ ? faidx_nseq(fai_) : 0;
}

std::string FastaReader::sequence_name(int index) const {
    if (!fai_ || index < 0 || index >= faidx_nseq(fai_)) {
        return "";
    }
    return faidx_iseq(fai_, index);
}

std::string FastaReader::fetch_sequence(const std::string& chr) const {
    hts_pos_t len = 0;
    char* seq = fai_ ? fai_fetch64(fai_, chr.c_str(), &len) : nullptr;
    if (!seq || len < 0) {
        if (seq) free(seq);
        throw UserError("Can't read sequence " + chr + " from " + fasta_path_);
    }

    std::string result(seq, static_cast<size_t>(len));
    free(seq);

    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string FastaReader::load_single_contig() const {
    const int n_seqs = num_sequences();
    if (n_seqs != 1) {
        throw UserError("Expecting a single reference sequence in " + fasta_path_ + ", found " +
                        std::to_string(n_seqs));
    }

    const std::string name = sequence_name(0);
    std::string seq = fetch_sequence(name);
    auto bad = std::find_if(seq.begin(), seq.end(), [](char c) {
        return c != 'A' && c != 'C' && c != 'G' && c != 'T';
    });
    if (bad != seq.end()) {
        throw UserError("Reference " + name + " has a non-ACGT base '" + std::string(1, *bad) + "' at position " +
                        std::to_string(bad - seq.begin() + 1));
    }

    LOG_INFO("Loaded reference " + name + " (" + std::to_string(seq.size()) + " bp)");
    return seq;
}

}  // namespace MiteSeq
