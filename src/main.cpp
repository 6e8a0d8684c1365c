#include <omp.h>

#include <iostream>

#include "core/CodonTranslation.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/ReadProcessor.hpp"
#include "io/ReportWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/FastaReader.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    MiteSeq::Utils::ResourceMonitor monitor;

    MiteSeq::Config config;

    if (!MiteSeq::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    auto& logger = MiteSeq::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty() && !logger.set_log_file(config.log_file)) {
        LOG_WARNING("Cannot open log file " + config.log_file + ", logging to the console only");
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    if (config.is_debug()) {
        config.print();
    }

    omp_set_num_threads(config.threads);

    try {
        MiteSeq::Utils::ScopedLogger main_scope("Main Execution");

        LOG_INFO("[1] Loading reference...");
        const std::string ref_seq = MiteSeq::FastaReader(config.reference_fasta_path).load_single_contig();
        const MiteSeq::CodonTranslation translation(config.codon_translation);

        MiteSeq::ReadProcessor processor(ref_seq, config);

        {
            MiteSeq::Utils::ScopedLogger read_scope("[2] Processing reads from " + config.bam_path);
            processor.process_bam(config.bam_path, config.threads);
        }

        const MiteSeq::ReadCounts& counts = processor.aggregator().counts();
        LOG_INFO("Reads: " + std::to_string(counts.reads_total) + ", molecules: " +
                 std::to_string(counts.total_molecules()) + ", called variant molecules: " +
                 std::to_string(counts.called_variant_molecules) + ", distinct variant sets: " +
                 std::to_string(processor.aggregator().variant_counts().size()));

        LOG_INFO("[3] Writing reports...");
        MiteSeq::ReportOptions options;
        options.min_variant_observations = config.min_variant_observations;
        options.min_length = config.min_length;
        options.num_threads = config.threads;
        MiteSeq::ReportWriter writer(processor.aggregator(), translation, options);
        writer.write_all(config);

    } catch (const MiteSeq::UserError& e) {
        LOG_ERROR("A USER ERROR has occurred: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    const int64_t n_warnings = MiteSeq::Utils::Logger::instance().message_count(MiteSeq::LogLevel::LOG_WARN);
    if (n_warnings > 0) {
        LOG_INFO("Finished with " + std::to_string(n_warnings) + " warning(s)");
    }
    LOG_INFO(monitor.format_stats("Total Execution"));

    return 0;
}
