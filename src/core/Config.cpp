#include "core/Config.hpp"

#include <htslib/faidx.h>
#include <htslib/hts.h>
#include <htslib/sam.h>

#include <filesystem>
#include <iostream>

namespace MiteSeq {

namespace {

bool check_alignment_file(const std::string& path) {
    samFile* fp = sam_open(path.c_str(), "r");
    if (fp == nullptr) {
        std::cerr << "Error: Cannot open reads file: " << path << std::endl;
        return false;
    }
    bool valid = true;
    sam_hdr_t* hdr = sam_hdr_read(fp);
    if (hdr == nullptr) {
        std::cerr << "Error: Cannot read header from reads file: " << path << std::endl;
        valid = false;
    } else {
        sam_hdr_destroy(hdr);
    }
    sam_close(fp);
    return valid;
}

bool check_reference(const std::string& path) {
    // builds the .fai next to the FASTA when it is missing
    faidx_t* fai = fai_load(path.c_str());
    if (fai == nullptr) {
        std::cerr << "Error: Cannot load reference FASTA: " << path << std::endl;
        return false;
    }
    bool valid = true;
    if (faidx_nseq(fai) != 1) {
        std::cerr << "Error: Expecting a single reference sequence, found " << faidx_nseq(fai) << " in " << path
                  << std::endl;
        valid = false;
    }
    fai_destroy(fai);
    return valid;
}

}  // namespace

bool Config::validate() const {
    bool valid = true;

    if (bam_path.empty()) {
        std::cerr << "Error: Reads file path is required." << std::endl;
        valid = false;
    } else if (!check_alignment_file(bam_path)) {
        valid = false;
    }

    if (reference_fasta_path.empty()) {
        std::cerr << "Error: Reference FASTA path is required." << std::endl;
        valid = false;
    } else if (!check_reference(reference_fasta_path)) {
        valid = false;
    }

    if (orf_coords.empty()) {
        std::cerr << "Error: ORF coordinates are required." << std::endl;
        valid = false;
    }

    if (output_file_prefix.empty()) {
        std::cerr << "Error: Output file prefix is required." << std::endl;
        valid = false;
    } else {
        std::filesystem::path parent = std::filesystem::path(output_file_prefix).parent_path();
        if (!parent.empty() && !std::filesystem::is_directory(parent)) {
            std::cerr << "Error: Output directory does not exist: " << parent.string() << std::endl;
            valid = false;
        }
    }

    if (min_q < 0) {
        std::cerr << "Error: min_q must not be negative." << std::endl;
        valid = false;
    }

    if (min_length < 1) {
        std::cerr << "Error: min_length must be positive." << std::endl;
        valid = false;
    }

    if (min_flanking_length < 0) {
        std::cerr << "Error: min_flanking_length must not be negative." << std::endl;
        valid = false;
    }

    if (min_variant_observations < 0) {
        std::cerr << "Error: min_variant_observations must not be negative." << std::endl;
        valid = false;
    }

    if (codon_translation.size() != static_cast<size_t>(N_REGULAR_CODONS)) {
        std::cerr << "Error: Codon translation table must have " << N_REGULAR_CODONS << " letters, got "
                  << codon_translation.size() << "." << std::endl;
        valid = false;
    }

    if (threads < 1) {
        std::cerr << "Error: threads must be at least 1." << std::endl;
        valid = false;
    }

    return valid;
}

void Config::print(std::ostream& os) const {
    os << "--- Configuration ---" << std::endl;
    os << "Reads: " << bam_path << std::endl;
    os << "Reference: " << reference_fasta_path << std::endl;
    os << "ORF: " << orf_coords << std::endl;
    os << "Output Prefix: " << output_file_prefix << std::endl;
    os << "Min Q: " << min_q << std::endl;
    os << "Min Length: " << min_length << std::endl;
    os << "Min Flanking Length: " << min_flanking_length << std::endl;
    os << "Min Variant Observations: " << min_variant_observations << std::endl;
    os << "Codon Translation: " << codon_translation << std::endl;
    os << "Paired Mode: " << (paired_mode ? "yes" : "no") << std::endl;
    os << "Threads: " << threads << std::endl;
    os << "Log File: " << (log_file.empty() ? "None" : log_file) << std::endl;
    os << "---------------------" << std::endl;
}

}  // namespace MiteSeq
