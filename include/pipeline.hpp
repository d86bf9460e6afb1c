/**
 * Pipeline Orchestrator
 *
 * Runs locate -> decompose -> predict over collections of variant sets,
 * optionally fanning independent sets out across OpenMP threads, and
 * collects per-set failures and per-record skips.
 */

#ifndef MTVEP_PIPELINE_HPP
#define MTVEP_PIPELINE_HPP

#include "mt_annotator.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>

namespace mtvep {

class AnnotationSourceManager;

/**
 * Run options, mapped from command-line flags
 */
struct PipelineConfig {
    bool filter_low_quality = false;    // Drop calls that failed PASS
    bool compute_aa_changes = true;     // Decompose + predict coding variants
    bool parallel = false;              // Fan sets out across threads
    int num_threads = 0;                // 0 = OpenMP default
    bool validate_ref_alleles = true;   // Compare REF against the reference sequence
};

/**
 * A record skipped by validation, or an input line that could not be parsed
 * (line_number > 0, record_index unused)
 */
struct RecordFailure {
    size_t set_index = 0;
    size_t record_index = 0;
    std::string reason;
    int line_number = 0;

    bool from_input() const { return line_number > 0; }

    bool operator==(const RecordFailure& other) const {
        return set_index == other.set_index && record_index == other.record_index &&
               reason == other.reason && line_number == other.line_number;
    }
};

/**
 * A variant set that could not be processed
 */
struct SetFailure {
    size_t set_index = 0;
    std::string sample;
    std::string reason;
};

/**
 * Results for one variant set
 */
struct AnnotatedResult {
    std::string sample;
    bool completed = false;
    std::string failure;                        // Reason when not completed
    std::vector<AnnotatedVariant> annotated_variants;
    std::vector<ConsequenceAnnotation> consequences;
    std::vector<size_t> consequence_owner;      // Index into annotated_variants per consequence
    std::vector<RecordFailure> skipped;

    bool operator==(const AnnotatedResult& other) const {
        return sample == other.sample && completed == other.completed &&
               failure == other.failure &&
               annotated_variants == other.annotated_variants &&
               consequences == other.consequences &&
               consequence_owner == other.consequence_owner &&
               skipped == other.skipped;
    }
};

/**
 * Output of a pipeline run: one result per input set, in input order
 */
struct RunResult {
    std::vector<AnnotatedResult> results;
    std::vector<SetFailure> failures;
    std::vector<RecordFailure> skipped_records;

    size_t completed_sets() const;
};

/**
 * Check a call against the reference
 * @throws UnsupportedReferenceError for foreign contigs or positions past the
 *         reference end
 * @throws MalformedVariantError for empty/symbolic/non-nucleotide alleles,
 *         REF equal to ALT, pos < 1, or a REF that disagrees with the reference
 */
void validate_call(const VariantCall& call, const ReferenceSequence& reference,
                   bool check_ref_allele = true);

class PipelineOrchestrator {
public:
    PipelineOrchestrator(AnnotationContext context, PipelineConfig config = PipelineConfig());

    /**
     * Attach impact sources for enrichment of coding variants
     */
    void set_annotation_sources(std::shared_ptr<AnnotationSourceManager> sources);

    const PipelineConfig& config() const { return config_; }

    /**
     * Run with the configured compute_aa_changes/parallel flags
     */
    RunResult run(const std::vector<VariantSet>& sets) const;

    RunResult run(const std::vector<VariantSet>& sets,
                  bool compute_aa_changes,
                  bool parallel) const;

    /**
     * Process a single set. Lines dropped by the loader are reported first
     * in the result's skipped list.
     * @throws UnsupportedReferenceError if the set cannot be annotated
     */
    AnnotatedResult process_set(const VariantSet& set,
                                size_t set_index,
                                bool compute_aa_changes) const;

private:
    AnnotationContext context_;
    PipelineConfig config_;
    RegionLocator locator_;
    VariantDecomposer decomposer_;
    ConsequencePredictor predictor_;
    std::shared_ptr<AnnotationSourceManager> sources_;
};

// ============================================================================
// Set-level helpers
// ============================================================================

/**
 * Calls that passed the caller's filters
 */
VariantSet pass_only(const VariantSet& set);

/**
 * Calls whose ref and alt alleles have equal length
 */
VariantSet snv_only(const VariantSet& set);

/**
 * Located variants restricted to coding regions
 */
std::vector<AnnotatedVariant> encoding(const AnnotationContext& context,
                                       const VariantSet& set);

/**
 * Count located variants per region class ("intergenic" for no overlap)
 */
std::map<std::string, int> tally_variants(const AnnotationContext& context,
                                          const VariantSet& set,
                                          bool filter_low_quality = true);

/**
 * Reference with PASS SNVs applied, for haplogroup tools
 * @throws UnsupportedReferenceError unless the reference is rCRS
 */
std::string consensus_sequence(const AnnotationContext& context,
                               const VariantSet& set);

} // namespace mtvep

#endif // MTVEP_PIPELINE_HPP
