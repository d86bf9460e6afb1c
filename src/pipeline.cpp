/**
 * Pipeline Orchestrator - Implementation
 */

#include "pipeline.hpp"
#include "annotation_source.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <omp.h>

namespace mtvep {

namespace {

bool is_nucleotide_code(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'A': case 'C': case 'G': case 'T': case 'N':
        case 'R': case 'Y': case 'S': case 'W': case 'K': case 'M':
        case 'B': case 'D': case 'H': case 'V':
            return true;
        default:
            return false;
    }
}

void check_allele(const std::string& allele, const char* label, const VariantCall& call) {
    if (allele.empty()) {
        throw MalformedVariantError(std::string("Empty ") + label + " allele at position " +
                                    std::to_string(call.pos));
    }
    if (allele[0] == '<' || allele == "*" ||
        allele.find_first_of("[]") != std::string::npos) {
        throw MalformedVariantError(std::string("Symbolic ") + label + " allele '" + allele +
                                    "' at position " + std::to_string(call.pos));
    }
    if (!std::all_of(allele.begin(), allele.end(), is_nucleotide_code)) {
        throw MalformedVariantError(std::string("Non-nucleotide ") + label + " allele '" + allele +
                                    "' at position " + std::to_string(call.pos));
    }
}

} // anonymous namespace

// ============================================================================
// Validation
// ============================================================================

void validate_call(const VariantCall& call, const ReferenceSequence& reference,
                   bool check_ref_allele) {
    if (!is_mito_contig(call.chrom) && call.chrom != reference.name()) {
        throw UnsupportedReferenceError("Contig '" + call.chrom +
                                        "' is not a mitochondrial contig");
    }

    if (call.pos < 1) {
        throw MalformedVariantError("Invalid position " + std::to_string(call.pos));
    }

    check_allele(call.ref_allele, "reference", call);
    check_allele(call.alt_allele, "alternate", call);

    if (std::equal(call.ref_allele.begin(), call.ref_allele.end(),
                   call.alt_allele.begin(), call.alt_allele.end(),
                   [](unsigned char a, unsigned char b) { return std::toupper(a) == std::toupper(b); })) {
        throw MalformedVariantError("Alternate allele equals reference allele " + call.ref_allele +
                                    " at position " + std::to_string(call.pos));
    }

    if (call.end() > reference.length()) {
        throw UnsupportedReferenceError(
            "Variant " + impact_key(call) + " lies past the end of " + reference.name() +
            " (" + std::to_string(reference.length()) + " bp)");
    }

    if (!check_ref_allele) return;

    const std::string expected = reference.get_sequence(call.pos, call.end());
    for (size_t i = 0; i < expected.size(); ++i) {
        char observed = static_cast<char>(std::toupper(static_cast<unsigned char>(call.ref_allele[i])));
        if (observed == 'N' || expected[i] == 'N') continue;
        if (observed != expected[i]) {
            throw MalformedVariantError("Reference allele " + call.ref_allele + " at position " +
                                        std::to_string(call.pos) + " does not match " +
                                        reference.name() + " (" + expected + ")");
        }
    }
}

// ============================================================================
// PipelineOrchestrator
// ============================================================================

size_t RunResult::completed_sets() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [](const AnnotatedResult& r) { return r.completed; }));
}

PipelineOrchestrator::PipelineOrchestrator(AnnotationContext context, PipelineConfig config)
    : context_(context),
      config_(config),
      locator_(context),
      decomposer_(context) {}

void PipelineOrchestrator::set_annotation_sources(std::shared_ptr<AnnotationSourceManager> sources) {
    sources_ = std::move(sources);
}

RunResult PipelineOrchestrator::run(const std::vector<VariantSet>& sets) const {
    return run(sets, config_.compute_aa_changes, config_.parallel);
}

RunResult PipelineOrchestrator::run(const std::vector<VariantSet>& sets,
                                    bool compute_aa_changes,
                                    bool parallel) const {
    RunResult run_result;
    run_result.results.resize(sets.size());

    // Each set writes only its own slot
    std::vector<std::optional<std::string>> errors(sets.size());

    auto process = [&](size_t i) {
        try {
            run_result.results[i] = process_set(sets[i], i, compute_aa_changes);
        } catch (const UnsupportedReferenceError& e) {
            errors[i] = std::string("unsupported reference: ") + e.what();
        } catch (const std::exception& e) {
            errors[i] = std::string(e.what());
        }
    };

    if (parallel && sets.size() > 1) {
        int num_threads = config_.num_threads > 0 ? config_.num_threads : omp_get_max_threads();
        log(LogLevel::DEBUG, "Processing " + std::to_string(sets.size()) + " variant sets on " +
            std::to_string(num_threads) + " threads");

        const long n_sets = static_cast<long>(sets.size());
        #pragma omp parallel for schedule(dynamic) num_threads(num_threads)
        for (long i = 0; i < n_sets; ++i) {
            process(static_cast<size_t>(i));
        }
    } else {
        for (size_t i = 0; i < sets.size(); ++i) {
            process(i);
        }
    }

    // Merge in input order so parallel and sequential runs report identically
    for (size_t i = 0; i < sets.size(); ++i) {
        AnnotatedResult& result = run_result.results[i];

        if (errors[i]) {
            result.sample = sets[i].sample;
            result.completed = false;
            result.failure = *errors[i];
            run_result.failures.push_back({i, sets[i].sample, *errors[i]});
            log(LogLevel::WARNING, "Variant set " + std::to_string(i) + " (" + sets[i].sample +
                ") failed: " + *errors[i]);
            continue;
        }

        for (const auto& skip : result.skipped) {
            if (skip.from_input()) {
                log(LogLevel::WARNING, "Skipped input line " + std::to_string(skip.line_number) +
                    " of " + sets[i].sample + ": " + skip.reason);
            } else {
                log(LogLevel::WARNING, "Skipped record " + std::to_string(skip.record_index) +
                    " of " + sets[i].sample + ": " + skip.reason);
            }
            run_result.skipped_records.push_back(skip);
        }
    }

    log(LogLevel::INFO, "Processed " + std::to_string(sets.size()) + " variant sets: " +
        std::to_string(run_result.completed_sets()) + " completed, " +
        std::to_string(run_result.failures.size()) + " failed, " +
        std::to_string(run_result.skipped_records.size()) + " records skipped");

    return run_result;
}

AnnotatedResult PipelineOrchestrator::process_set(const VariantSet& set,
                                                  size_t set_index,
                                                  bool compute_aa_changes) const {
    AnnotatedResult result;
    result.sample = set.sample;

    const ReferenceSequence& reference = context_.reference();

    for (const auto& issue : set.parse_issues) {
        result.skipped.push_back({set_index, 0, issue.reason, issue.line_number});
    }

    for (size_t i = 0; i < set.calls.size(); ++i) {
        const VariantCall& call = set.calls[i];
        if (config_.filter_low_quality && !call.pass_filter) continue;

        try {
            validate_call(call, reference, config_.validate_ref_alleles);
        } catch (const MalformedVariantError& e) {
            result.skipped.push_back({set_index, i, e.what()});
            continue;
        }

        auto located = locator_.locate(call, config_.filter_low_quality);
        if (located) {
            result.annotated_variants.push_back(std::move(*located));
        }
    }

    for (size_t v = 0; v < result.annotated_variants.size(); ++v) {
        AnnotatedVariant& variant = result.annotated_variants[v];
        if (!variant.is_coding()) continue;

        if (compute_aa_changes) {
            for (const auto& edit : decomposer_.decompose(variant)) {
                result.consequences.push_back(predictor_.predict(edit));
                result.consequence_owner.push_back(v);
            }
        }

        if (sources_) {
            sources_->annotate_all(variant, variant.impact);
        }
    }

    log(LogLevel::DEBUG, "Sample " + set.sample + ": " +
        std::to_string(result.annotated_variants.size()) + " variants, " +
        std::to_string(result.consequences.size()) + " consequences");

    result.completed = true;
    return result;
}

// ============================================================================
// Set-level helpers
// ============================================================================

VariantSet pass_only(const VariantSet& set) {
    VariantSet result;
    result.sample = set.sample;
    result.parse_issues = set.parse_issues;
    std::copy_if(set.calls.begin(), set.calls.end(), std::back_inserter(result.calls),
                 [](const VariantCall& call) { return call.pass_filter; });
    return result;
}

VariantSet snv_only(const VariantSet& set) {
    VariantSet result;
    result.sample = set.sample;
    result.parse_issues = set.parse_issues;
    std::copy_if(set.calls.begin(), set.calls.end(), std::back_inserter(result.calls),
                 [](const VariantCall& call) { return variant_type(call) == "SNV"; });
    return result;
}

std::vector<AnnotatedVariant> encoding(const AnnotationContext& context,
                                       const VariantSet& set) {
    RegionLocator locator(context);
    auto located = locator.locate_all(set.calls);
    located.erase(std::remove_if(located.begin(), located.end(),
                                 [](const AnnotatedVariant& v) { return !v.is_coding(); }),
                  located.end());
    return located;
}

std::map<std::string, int> tally_variants(const AnnotationContext& context,
                                          const VariantSet& set,
                                          bool filter_low_quality) {
    RegionLocator locator(context);
    std::map<std::string, int> counts;
    for (const auto& variant : locator.locate_all(set.calls, filter_low_quality)) {
        counts[variant.region ? region_to_string(*variant.region) : "intergenic"]++;
    }
    return counts;
}

std::string consensus_sequence(const AnnotationContext& context,
                               const VariantSet& set) {
    const ReferenceSequence& reference = context.reference();
    const std::string build = detect_reference_build(reference);
    if (build != "rCRS") {
        throw UnsupportedReferenceError("Consensus sequences require an rCRS reference, got " + build);
    }

    std::string sequence = reference.sequence();
    for (const auto& call : snv_only(pass_only(set)).calls) {
        if (call.pos < 1 || call.end() > reference.length()) {
            throw UnsupportedReferenceError("Variant " + impact_key(call) +
                                            " lies outside the reference");
        }
        sequence.replace(static_cast<size_t>(call.pos - 1), call.alt_allele.size(), call.alt_allele);
    }
    return sequence;
}

} // namespace mtvep
