/**
 * mtvep - Mitochondrial Variant Annotator - Main Entry Point
 *
 * Annotates mitochondrial variant calls against a local annotation table and
 * reference sequence - no external API calls.
 */

#include "mt_annotator.hpp"
#include "annotation_sources.hpp"
#include "file_parsers.hpp"
#include "output_writer.hpp"
#include "pipeline.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "mtvep - Mitochondrial Variant Annotator\n"
              << "=======================================\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Required Data Files:\n"
              << "  --annotation FILE       Annotation table (chrom, start, end, strand, gene, region)\n"
              << "  --fasta FILE            Mitochondrial reference FASTA (e.g. rCRS)\n\n"
              << "Variant Input (at least one):\n"
              << "  --vcf FILE              VCF file, one variant set per file (repeatable)\n"
              << "  -v, --variant CHR:POS:REF:ALT   Single variant to annotate\n\n"
              << "Processing Options:\n"
              << "  --filter-low-quality    Drop calls that did not PASS\n"
              << "  --no-aa-changes         Skip codon decomposition and consequence prediction\n"
              << "  --no-ref-check          Do not compare REF alleles against the reference\n"
              << "  --parallel              Process variant sets in parallel (OpenMP)\n"
              << "  --threads N             Number of worker threads (default: OpenMP default)\n\n"
              << "Impact Annotations:\n"
              << "  --mitimpact FILE        MitImpact export (tabix-indexed .txt.gz, requires htslib)\n"
              << "  --mitimpact-fields F    Comma-separated MitImpact columns to report\n\n"
              << "Output Options:\n"
              << "  -o, --output FILE       Output file path (default: stdout, .gz compresses)\n"
              << "  --format FORMAT         tsv (default) or json\n"
              << "  --stats                 Print summary statistics to stderr\n"
              << "  --stats-json            Print summary statistics as JSON to stderr\n"
              << "  --tally                 Print per-region variant counts for each set\n"
              << "  --consensus FILE        Write PASS-SNV consensus sequences (FASTA, rCRS only)\n\n"
              << "Other Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  --debug                 Enable debug logging\n\n"
              << "Examples:\n"
              << "  # Annotate a single SNV\n"
              << "  " << program_name << " --annotation mt_genes.tsv --fasta rCRS.fa -v chrM:3308:T:C\n\n"
              << "  # Annotate several samples in parallel with MitImpact predictions\n"
              << "  " << program_name << " --annotation mt_genes.tsv --fasta rCRS.fa \\\n"
              << "      --vcf s1.vcf.gz --vcf s2.vcf.gz --parallel \\\n"
              << "      --mitimpact MitImpact_db.txt.gz -o results.tsv\n"
              << std::endl;
}

// Parse variant string in format CHR:POS:REF:ALT or CHR-POS-REF-ALT
bool parse_variant(const std::string& variant, mtvep::VariantCall& call) {
    std::string normalized = variant;

    for (char& c : normalized) {
        if (c == '-') c = ':';
    }

    auto fields = mtvep::split_line(normalized, ':');
    if (fields.size() != 4) return false;

    try {
        size_t consumed = 0;
        call.chrom = fields[0];
        call.pos = std::stoi(fields[1], &consumed);
        if (consumed != fields[1].size()) return false;
        call.ref_allele = fields[2];
        call.alt_allele = fields[3];
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> parse_field_list(const std::string& fields) {
    std::vector<std::string> result;
    std::istringstream iss(fields);
    std::string field;
    while (std::getline(iss, field, ',')) {
        field.erase(0, field.find_first_not_of(" \t"));
        field.erase(field.find_last_not_of(" \t") + 1);
        if (!field.empty()) {
            result.push_back(field);
        }
    }
    return result;
}

int main(int argc, char* argv[]) {
    std::string annotation_path;
    std::string fasta_path;
    std::vector<std::string> vcf_paths;
    std::vector<std::string> variants;
    std::string output_path = "-";
    std::string format = "tsv";
    std::string mitimpact_path;
    std::string mitimpact_fields;
    std::string consensus_path;
    bool show_stats = false;
    bool stats_json = false;
    bool show_tally = false;
    bool debug = false;

    mtvep::PipelineConfig config;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--annotation" && i + 1 < argc) {
            annotation_path = argv[++i];
        } else if (arg == "--fasta" && i + 1 < argc) {
            fasta_path = argv[++i];
        } else if (arg == "--vcf" && i + 1 < argc) {
            vcf_paths.push_back(argv[++i]);
        } else if ((arg == "-v" || arg == "--variant") && i + 1 < argc) {
            variants.push_back(argv[++i]);
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (arg == "--filter-low-quality") {
            config.filter_low_quality = true;
        } else if (arg == "--no-aa-changes") {
            config.compute_aa_changes = false;
        } else if (arg == "--no-ref-check") {
            config.validate_ref_alleles = false;
        } else if (arg == "--parallel") {
            config.parallel = true;
        } else if (arg == "--threads" && i + 1 < argc) {
            try {
                config.num_threads = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid thread count: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--mitimpact" && i + 1 < argc) {
            mitimpact_path = argv[++i];
        } else if (arg == "--mitimpact-fields" && i + 1 < argc) {
            mitimpact_fields = argv[++i];
        } else if (arg == "--stats") {
            show_stats = true;
        } else if (arg == "--stats-json") {
            stats_json = true;
        } else if (arg == "--tally") {
            show_tally = true;
        } else if (arg == "--consensus" && i + 1 < argc) {
            consensus_path = argv[++i];
        } else if (arg == "--debug") {
            debug = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Set log level
    if (debug) {
        mtvep::set_log_level(mtvep::LogLevel::DEBUG);
    }

    // Validate required arguments
    if (annotation_path.empty() || fasta_path.empty()) {
        std::cerr << "Error: Both --annotation and --fasta are required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (vcf_paths.empty() && variants.empty()) {
        std::cerr << "Error: Either --vcf or --variant is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto context = mtvep::AnnotationContext::load(annotation_path, fasta_path);
        mtvep::log(mtvep::LogLevel::INFO, "Reference build: " +
                   mtvep::detect_reference_build(context.reference()) + ", " +
                   std::to_string(context.index().size()) + " annotated intervals, " +
                   std::to_string(context.index().genes().size()) + " genes");

        // Collect variant sets
        std::vector<mtvep::VariantSet> sets;
        for (const auto& path : vcf_paths) {
            sets.push_back(mtvep::load_vcf(path));
            const auto& issues = sets.back().parse_issues;
            if (!issues.empty()) {
                mtvep::log(mtvep::LogLevel::WARNING, std::to_string(issues.size()) +
                           " unparseable records skipped in " + path);
            }
        }

        if (!variants.empty()) {
            mtvep::VariantSet cli_set;
            cli_set.sample = "command_line";
            for (const auto& variant : variants) {
                mtvep::VariantCall call;
                if (!parse_variant(variant, call)) {
                    std::cerr << "Error: Invalid variant format. Use CHR:POS:REF:ALT\n"
                              << "Example: chrM:3308:T:C" << std::endl;
                    return 1;
                }
                cli_set.calls.push_back(call);
            }
            sets.push_back(std::move(cli_set));
        }

        // Impact sources
        auto sources = std::make_shared<mtvep::AnnotationSourceManager>();
        if (!mitimpact_path.empty()) {
            sources->add_source(mtvep::create_mitimpact_source(
                mitimpact_path, parse_field_list(mitimpact_fields)));
            sources->initialize_all();
            mtvep::log(mtvep::LogLevel::DEBUG, sources->get_stats());
        }

        mtvep::PipelineOrchestrator orchestrator(context, config);
        if (!sources->empty()) {
            orchestrator.set_annotation_sources(sources);
        }

        auto run = orchestrator.run(sets);

        // Write results
        auto writer = mtvep::create_output_writer(mtvep::parse_output_format(format), output_path);
        writer->write_header(sources->get_all_fields());
        writer->write_results(run.results);
        writer->write_footer();
        writer->close();

        if (show_tally) {
            for (const auto& set : sets) {
                std::cerr << "Region tally for " << set.sample << ":\n";
                for (const auto& [region, count] :
                     mtvep::tally_variants(context, set, config.filter_low_quality)) {
                    std::cerr << "  " << region << ": " << count << "\n";
                }
            }
        }

        if (!consensus_path.empty()) {
            std::ofstream fasta(consensus_path);
            if (!fasta.is_open()) {
                throw std::runtime_error("Cannot open consensus output file: " + consensus_path);
            }
            for (const auto& set : sets) {
                std::string sequence = mtvep::consensus_sequence(context, set);
                fasta << ">" << set.sample << "\n";
                for (size_t pos = 0; pos < sequence.size(); pos += 60) {
                    fasta << sequence.substr(pos, 60) << "\n";
                }
            }
            mtvep::log(mtvep::LogLevel::INFO, "Consensus sequences saved to: " + consensus_path);
        }

        if (show_stats) {
            std::cerr << writer->get_stats().to_string();
        }
        if (stats_json) {
            std::cerr << writer->get_stats().to_json() << std::endl;
        }

        for (const auto& failure : run.failures) {
            std::cerr << "Failed set " << failure.set_index << " (" << failure.sample << "): "
                      << failure.reason << std::endl;
        }

        mtvep::log(mtvep::LogLevel::INFO, "Annotation complete. " +
                   std::to_string(run.completed_sets()) + "/" + std::to_string(sets.size()) +
                   " variant sets written to " + (output_path == "-" ? "stdout" : output_path));

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
