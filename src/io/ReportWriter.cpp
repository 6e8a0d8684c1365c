#include "io/ReportWriter.hpp"

#include <omp.h>

#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <utility>

#include "core/CodonEncoder.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace MiteSeq {

namespace {

void write_fraction(std::ostream& os, int64_t count, int64_t total) {
    const double percent = total ? 100.0 * static_cast<double>(count) / static_cast<double>(total) : 0.0;
    os << std::fixed << std::setprecision(2) << std::setw(6) << percent;
}

void write_row_label(std::ostream& os, int codon_id) {
    os << std::setw(5) << codon_id + 1;
}

void write_row_total(std::ostream& os, int64_t total) {
    os << std::setw(9) << total << '\n';
}

}  // namespace

ReportWriter::ReportWriter(const MoleculeAggregator& aggregator, const CodonTranslation& translation,
                           const ReportOptions& options)
    : aggregator_(aggregator), translation_(translation), options_(options) {
}

void ReportWriter::write_file(const std::string& path, ReportMethod method) const {
    std::ofstream ofs(path);
    if (!ofs) {
        throw UserError("Can't write " + path);
    }
    (this->*method)(ofs);
    ofs.flush();
    if (!ofs) {
        throw UserError("Can't write " + path);
    }
    LOG_DEBUG("Wrote " + path);
}

void ReportWriter::write_all(const Config& config) const {
    static const std::vector<std::pair<const char*, ReportMethod>> REPORTS = {
        {"variantCounts", &ReportWriter::write_variant_counts},
        {"refCoverage", &ReportWriter::write_ref_coverage},
        {"codonCounts", &ReportWriter::write_codon_counts},
        {"codonFractions", &ReportWriter::write_codon_fractions},
        {"aaCounts", &ReportWriter::write_aa_counts},
        {"aaFractions", &ReportWriter::write_aa_fractions},
        {"readCounts", &ReportWriter::write_read_counts},
        {"coverageLengthCounts", &ReportWriter::write_coverage_length_counts},
    };
    for (const auto& report : REPORTS) {
        write_file(config.output_path(report.first), report.second);
    }
    LOG_INFO("Wrote " + std::to_string(REPORTS.size()) + " reports to " + config.output_path("*"));
}

std::vector<int64_t> ReportWriter::count_signature_spanners(const std::vector<const SnvList*>& signatures) const {
    const IntervalSpanCounter& spans = aggregator_.span_counter();
    const int32_t flank = aggregator_.config().min_flanking_length;
    const int64_t n_signatures = static_cast<int64_t>(signatures.size());
    std::vector<int64_t> spanners(signatures.size(), 0);

    // read-only queries against the span table
#pragma omp parallel for schedule(dynamic, 64) num_threads(options_.num_threads)
    for (int64_t i = 0; i < n_signatures; ++i) {
        const SnvList& snvs = *signatures[i];
        spanners[i] = spans.count_spanners(snvs.front().ref_index - flank, snvs.back().ref_index + flank);
    }
    return spanners;
}

void ReportWriter::write_variant_counts(std::ostream& os) const {
    const auto entries = aggregator_.variant_counts().entries(options_.min_variant_observations);
    std::vector<const SnvList*> signatures;
    signatures.reserve(entries.size());
    for (const auto* entry : entries) {
        signatures.push_back(&entry->first);
    }
    const std::vector<int64_t> spanners = count_signature_spanners(signatures);

    for (size_t i = 0; i < entries.size(); ++i) {
        const SnvList& snvs = entries[i]->first;
        const SignatureStats& stats = entries[i]->second;

        int64_t total_quality = 0;
        for (const auto& snv : snvs) {
            total_quality += snv.quality;
        }

        os << stats.count << '\t' << spanners[i] << '\t' << total_quality << '\t' << std::fixed
           << std::setprecision(1) << stats.mean_ref_coverage() << '\t' << snvs.size();
        const char* sep = "\t";
        for (const auto& snv : snvs) {
            os << sep << snv.to_string();
            sep = ", ";
        }
        describe_variants_as_codons(os, snvs);
        os << '\n';
    }
}

void ReportWriter::describe_variants_as_codons(std::ostream& os, const SnvList& snvs) const {
    const CodonEncoder& encoder = aggregator_.codon_encoder();
    const std::vector<CodonVariation> variations = encoder.encode_snvs_as_codons(snvs);
    const std::vector<int>& ref_codon_values = encoder.ref_codon_values();

    int64_t n_variations = 0;
    for (const auto& variation : variations) {
        if (!variation.is_frameshift()) ++n_variations;
    }
    os << '\t' << n_variations;

    const char* sep = "\t";
    for (const auto& variation : variations) {
        if (variation.is_frameshift()) continue;
        os << sep;
        sep = ", ";
        const int codon_id = variation.codon_id;
        os << codon_id << ':'
           << (variation.is_insertion() ? "---" : CodonTranslation::codon_label(ref_codon_values[codon_id])) << '>'
           << (variation.is_deletion() ? "---" : CodonTranslation::codon_label(variation.codon_value));
    }

    sep = "\t";
    for (const auto& variation : variations) {
        if (variation.is_frameshift()) continue;
        os << sep;
        sep = ", ";
        const int codon_id = variation.codon_id;
        if (variation.is_insertion()) {
            os << "I:->" << translation_.translate(variation.codon_value);
        } else if (variation.is_deletion()) {
            os << "D:" << translation_.translate(ref_codon_values[codon_id]) << ":-";
        } else {
            const char from_aa = translation_.translate(ref_codon_values[codon_id]);
            const char to_aa = translation_.translate(variation.codon_value);
            const char label = from_aa == to_aa ? 'S' : CodonEncoder::is_stop(variation.codon_value) ? 'N' : 'M';
            os << label << ':' << from_aa << '>' << to_aa;
        }
    }
}

void ReportWriter::write_ref_coverage(std::ostream& os) const {
    os << "RefPos\tCoverage\n";
    int32_t ref_pos = 1;
    for (int64_t coverage : aggregator_.ref_coverage()) {
        os << ref_pos++ << '\t' << coverage << '\n';
    }
}

void ReportWriter::write_codon_counts(std::ostream& os) const {
    for (int codon_value = 0; codon_value < N_REGULAR_CODONS; ++codon_value) {
        os << CodonTranslation::codon_label(codon_value) << '\t';
    }
    os << "NFS\tFS\tTotal\n";

    const CodonCountTable& counts = aggregator_.codon_encoder().codon_counts();
    for (Eigen::Index codon_id = 0; codon_id < counts.rows(); ++codon_id) {
        for (Eigen::Index col = 0; col < counts.cols(); ++col) {
            os << counts(codon_id, col) << '\t';
        }
        os << counts.row(codon_id).sum() << '\n';
    }
}

void ReportWriter::write_codon_fractions(std::ostream& os) const {
    os << "Codon";
    for (int codon_value = 0; codon_value < N_REGULAR_CODONS; ++codon_value) {
        os << "   " << CodonTranslation::codon_label(codon_value);
    }
    os << "   NFS    FS    Total\n";

    const CodonCountTable& counts = aggregator_.codon_encoder().codon_counts();
    for (Eigen::Index codon_id = 0; codon_id < counts.rows(); ++codon_id) {
        const int64_t total = counts.row(codon_id).sum();
        write_row_label(os, static_cast<int>(codon_id));
        for (Eigen::Index col = 0; col < counts.cols(); ++col) {
            write_fraction(os, counts(codon_id, col), total);
        }
        write_row_total(os, total);
    }
}

void ReportWriter::write_aa_counts(std::ostream& os) const {
    const CodonCountTable& counts = aggregator_.codon_encoder().codon_counts();
    const std::vector<char>& amino_acids = translation_.amino_acids();
    for (Eigen::Index codon_id = 0; codon_id < counts.rows(); ++codon_id) {
        if (codon_id == 0) {
            const char* prefix = "";
            for (char aa : amino_acids) {
                os << prefix << aa;
                prefix = "\t";
            }
            os << '\n';
        }
        const char* prefix = "";
        for (int64_t count : translation_.collapse(counts.row(codon_id))) {
            os << prefix << count;
            prefix = "\t";
        }
        os << '\n';
    }
}

void ReportWriter::write_aa_fractions(std::ostream& os) const {
    const CodonCountTable& counts = aggregator_.codon_encoder().codon_counts();
    const std::vector<char>& amino_acids = translation_.amino_acids();
    for (Eigen::Index codon_id = 0; codon_id < counts.rows(); ++codon_id) {
        if (codon_id == 0) {
            os << "Codon";
            for (char aa : amino_acids) {
                os << "     " << aa;
            }
            os << "    Total\n";
        }
        const int64_t total = counts.row(codon_id).sum();
        write_row_label(os, static_cast<int>(codon_id));
        for (int64_t count : translation_.collapse(counts.row(codon_id))) {
            write_fraction(os, count, total);
        }
        write_row_total(os, total);
    }
}

std::string ReportWriter::format_percent(int64_t count, int64_t total) {
    const double percent = total ? 100.0 * static_cast<double>(count) / static_cast<double>(total) : 0.0;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << percent << '%';
    return ss.str();
}

void ReportWriter::write_read_counts(std::ostream& os) const {
    const ReadCounts& counts = aggregator_.counts();
    const int64_t total_molecules = counts.total_molecules();
    const std::vector<int64_t>& coverage = aggregator_.ref_coverage();
    const int64_t covered_base_calls = std::accumulate(coverage.begin(), coverage.end(), int64_t{0});

    os << "Total Reads:\t" << counts.reads_total << '\n';
    os << "Unmapped Reads:\t" << counts.reads_unmapped << '\t'
       << format_percent(counts.reads_unmapped, counts.reads_total) << '\n';
    os << "LowQ Reads:\t" << counts.reads_low_quality << '\t'
       << format_percent(counts.reads_low_quality, counts.reads_total) << '\n';
    os << "Number of inconsistent pair molecules:\t" << counts.inconsistent_pairs << '\t'
       << format_percent(counts.inconsistent_pairs, total_molecules) << '\n';
    os << "Number of wild type molecules:\t" << counts.wild_type_molecules << '\t'
       << format_percent(counts.wild_type_molecules, total_molecules) << '\n';
    os << "Number of insufficient flank molecules:\t" << counts.insufficient_flank_molecules << '\t'
       << format_percent(counts.insufficient_flank_molecules, total_molecules) << '\n';
    os << "Number of low quality variation molecules:\t" << counts.low_quality_variant_molecules << '\t'
       << format_percent(counts.low_quality_variant_molecules, total_molecules) << '\n';
    os << "Number of called variant molecules:\t" << counts.called_variant_molecules << '\t'
       << format_percent(counts.called_variant_molecules, total_molecules) << '\n';
    os << "Base calls evaluated for variants:\t" << format_percent(covered_base_calls, counts.total_base_calls)
       << '\n';
}

void ReportWriter::write_coverage_length_counts(std::ostream& os) const {
    const std::vector<int64_t>& histogram = aggregator_.coverage_size_histogram();
    for (size_t length = static_cast<size_t>(options_.min_length); length < histogram.size(); ++length) {
        os << length << '\t' << histogram[length] << '\n';
    }
}

}  // namespace MiteSeq
