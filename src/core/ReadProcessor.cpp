#include "core/ReadProcessor.hpp"

#include <htslib/sam.h>

#include <memory>

#include "core/BamReader.hpp"
#include "core/Errors.hpp"
#include "core/ReadParser.hpp"
#include "utils/Logger.hpp"

namespace MiteSeq {

namespace {

constexpr int64_t PROGRESS_INTERVAL = 1000000;

struct BamRecordDeleter {
    void operator()(bam1_t* b) const { bam_destroy1(b); }
};

}  // namespace

ReadProcessor::ReadProcessor(const std::string& ref_seq, const Config& config)
    : paired_mode_(config.paired_mode),
      trimmer_(config.min_q, config.min_length),
      extractor_(ref_seq),
      aggregator_(ref_seq, config.orf_coords, MoleculeFilterConfig{config.min_q, config.min_flanking_length}) {
}

ReadReport ReadProcessor::get_read_report(const AlignedRead& read) {
    aggregator_.note_read(read.length(), read.is_mapped);
    if (!read.is_mapped) {
        return ReadReport();
    }

    const Interval trim = trimmer_.calculate_trim(read.quals);
    if (trim.empty()) {
        aggregator_.note_low_quality_read();
        return ReadReport();
    }

    return extractor_.extract(read, trim);
}

void ReadProcessor::apply(const ReadReport& report) {
    MoleculeCategory category = aggregator_.apply_report(report);
    if (Utils::Logger::instance().log_level() >= LogLevel::LOG_DEBUG && category != MoleculeCategory::EMPTY) {
        LOG_DEBUG("Molecule " + std::to_string(aggregator_.counts().total_molecules()) + ": " +
                  molecule_category_to_string(category));
    }
}

void ReadProcessor::apply_solo(const AlignedRead& read) {
    apply(get_read_report(read));
}

void ReadProcessor::rethrow_for_read(int64_t ordinal, const std::string& name, const std::exception& e) const {
    throw InternalError("Caught unexpected exception on read " + std::to_string(ordinal) + ": " + name + ": " +
                        e.what());
}

void ReadProcessor::process_read(const AlignedRead& read) {
    read_ordinal_ += 1;
    try {
        if (!paired_mode_ || !read.is_paired) {
            apply_solo(read);
            return;
        }

        if (!pending_mate_) {
            pending_mate_ = read;
            pending_ordinal_ = read_ordinal_;
            return;
        }

        if (pending_mate_->name != read.name) {
            LOG_WARNING("Read " + pending_mate_->name + " has no mate.");
            unmated_reads_ += 1;
            apply_solo(*pending_mate_);
            pending_mate_ = read;
            pending_ordinal_ = read_ordinal_;
            return;
        }

        ReadReport report1 = get_read_report(*pending_mate_);
        ReadReport report2 = get_read_report(read);
        pending_mate_.reset();

        PairMergeResult merged = PairReconciler::combine_reports(report1, report2);
        switch (merged.outcome) {
            case PairOutcome::MERGED:
            case PairOutcome::INCONSISTENT:
                apply(merged.report);
                break;
            case PairOutcome::APPLY_SEPARATELY:
                apply(report1);
                apply(report2);
                break;
        }
    } catch (const std::exception& e) {
        rethrow_for_read(read_ordinal_, read.name, e);
    }
}

void ReadProcessor::finish() {
    if (!pending_mate_) {
        return;
    }
    AlignedRead last = std::move(*pending_mate_);
    pending_mate_.reset();
    try {
        LOG_WARNING("Read " + last.name + " has no mate.");
        unmated_reads_ += 1;
        apply_solo(last);
    } catch (const std::exception& e) {
        rethrow_for_read(pending_ordinal_, last.name, e);
    }
}

int64_t ReadProcessor::process_bam(const std::string& bam_path, int n_threads) {
    BamReader reader(bam_path, n_threads);
    std::unique_ptr<bam1_t, BamRecordDeleter> record(bam_init1());
    if (!record) {
        throw InternalError("failed to allocate a BAM record");
    }

    int64_t skipped = 0;
    while (reader.next(record.get())) {
        if (!ReadParser::should_keep(record.get())) {
            skipped += 1;
            continue;
        }
        process_read(ReadParser::parse(record.get()));
        if (read_ordinal_ % PROGRESS_INTERVAL == 0) {
            LOG_INFO("Processed " + std::to_string(read_ordinal_) + " reads");
        }
    }
    finish();

    LOG_INFO("Read " + std::to_string(reader.records_read()) + " records from " + bam_path + " (" +
             std::to_string(skipped) + " secondary/supplementary skipped, " + std::to_string(unmated_reads_) +
             " without a mate)");
    return reader.records_read();
}

}  // namespace MiteSeq
