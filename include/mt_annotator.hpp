/**
 * mtvep - Mitochondrial Variant Annotator
 *
 * Annotates mitochondrial variant calls with gene/region context, derives
 * local coding coordinates, decomposes edits into codon-aligned units and
 * predicts amino-acid consequences with the vertebrate mitochondrial code.
 *
 * Required data:
 * - Annotation table (chrom, start, end, strand, gene, region)
 * - Mitochondrial reference sequence (FASTA, e.g. rCRS)
 */

#ifndef MTVEP_ANNOTATOR_HPP
#define MTVEP_ANNOTATOR_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <memory>
#include <stdexcept>

namespace mtvep {

// Forward declarations
class GenomeAnnotationIndex;
class ReferenceSequence;

// ============================================================================
// Errors
// ============================================================================

/**
 * Missing or malformed annotation table / reference sequence.
 * Fatal for the whole run.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A single variant record that cannot be annotated. The record is skipped.
 */
class MalformedVariantError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Variant set references a contig or positions the loaded reference does not
 * provide. Fatal for the owning variant set only.
 */
class UnsupportedReferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Impact lookup failed or returned nothing. Never fatal.
 */
class EnrichmentUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Region and consequence classes
// ============================================================================

/**
 * Region class of an annotated interval
 */
enum class RegionClass {
    CODING,
    TRNA,
    RRNA,
    CONTROL,
    NONCODING
};

/**
 * Get table representation of a region class ("coding", "tRNA", ...)
 */
std::string region_to_string(RegionClass region);

/**
 * Parse a region tag, nullopt if unknown
 */
std::optional<RegionClass> parse_region(const std::string& tag);

/**
 * Amino-acid consequence class
 */
enum class ConsequenceClass {
    SYNONYMOUS,
    MISSENSE,
    NONSENSE,
    READTHROUGH,
    FRAMESHIFT,
    UNKNOWN
};

std::string consequence_to_string(ConsequenceClass type);

// ============================================================================
// Data model
// ============================================================================

/**
 * Annotated genomic interval (1-based, inclusive)
 */
struct GenomicInterval {
    std::string chrom;
    int start = 0;
    int end = 0;
    char strand = '+';
    std::string gene;
    RegionClass region = RegionClass::NONCODING;

    bool contains(int pos) const { return pos >= start && pos <= end; }
    int length() const { return end - start + 1; }

    bool operator==(const GenomicInterval& other) const {
        return chrom == other.chrom && start == other.start && end == other.end &&
               strand == other.strand && gene == other.gene && region == other.region;
    }
};

/**
 * Variant call as produced by the upstream caller
 */
struct VariantCall {
    std::string chrom;
    int pos = 0;                    // 1-based
    std::string id;                 // VCF ID, may be empty
    std::string ref_allele;
    std::string alt_allele;
    int depth = 0;
    int alt_depth = 0;
    bool pass_filter = true;

    int end() const { return pos + static_cast<int>(ref_allele.size()) - 1; }

    bool operator==(const VariantCall& other) const {
        return chrom == other.chrom && pos == other.pos && id == other.id &&
               ref_allele == other.ref_allele && alt_allele == other.alt_allele &&
               depth == other.depth && alt_depth == other.alt_depth &&
               pass_filter == other.pass_filter;
    }
};

/**
 * "SNV" when ref and alt have the same length, otherwise "indel"
 */
std::string variant_type(const VariantCall& call);

/**
 * "start" for single-base calls, "start_end" for longer reference spans
 */
std::string position_string(const VariantCall& call);

/**
 * Lookup key for impact databases: chrom:posREF>ALT
 */
std::string impact_key(const VariantCall& call);

/**
 * Variant call with region context and local coding coordinates
 */
struct AnnotatedVariant {
    VariantCall call;

    std::optional<std::string> gene;
    std::vector<std::string> overlap_genes;     // All hits, only set for multi-gene overlaps
    std::optional<RegionClass> region;

    // 0-based offsets from the gene start, only for coding hits
    std::optional<int> local_start;
    std::optional<int> local_end;
    std::optional<int> start_codon;
    std::optional<int> end_codon;

    // Key: "source:field" (e.g., "mitimpact:APOGEE_boost_consensus")
    std::map<std::string, std::string> impact;

    /**
     * True once gene, region, locals and codons are all present
     */
    bool has_derived_fields() const;

    bool is_coding() const {
        return region == RegionClass::CODING && local_start.has_value() && local_end.has_value();
    }

    /**
     * Comma-joined overlap gene names (empty without a multi-gene overlap)
     */
    std::string overlap_genes_string() const;

    bool operator==(const AnnotatedVariant& other) const {
        return call == other.call && gene == other.gene &&
               overlap_genes == other.overlap_genes && region == other.region &&
               local_start == other.local_start && local_end == other.local_end &&
               start_codon == other.start_codon && end_codon == other.end_codon &&
               impact == other.impact;
    }
};

/**
 * One codon-scoped edit derived from an annotated variant.
 * ref_codon is empty for codons added by an in-frame insertion,
 * alt_codon is empty for codons removed by an in-frame deletion.
 */
struct DecomposedEdit {
    std::string gene;
    int codon_index = 0;            // 0-based
    std::string ref_codon;
    std::string alt_codon;
    bool frameshift = false;

    bool operator==(const DecomposedEdit& other) const {
        return gene == other.gene && codon_index == other.codon_index &&
               ref_codon == other.ref_codon && alt_codon == other.alt_codon &&
               frameshift == other.frameshift;
    }
};

/**
 * Amino-acid consequence of a decomposed edit
 */
struct ConsequenceAnnotation {
    std::string gene;
    int codon_index = 0;
    std::string ref_codon;
    std::string alt_codon;
    char ref_aa = 'X';              // '*' stop, '-' no codon, 'X' unknown
    char alt_aa = 'X';
    ConsequenceClass consequence = ConsequenceClass::UNKNOWN;

    int protein_position() const { return codon_index + 1; }

    /**
     * HGVS-style protein change (e.g., "p.Leu12Pro", "p.Leu12=", "p.Gln5Ter")
     */
    std::string protein_change() const;

    bool operator==(const ConsequenceAnnotation& other) const {
        return gene == other.gene && codon_index == other.codon_index &&
               ref_codon == other.ref_codon && alt_codon == other.alt_codon &&
               ref_aa == other.ref_aa && alt_aa == other.alt_aa &&
               consequence == other.consequence;
    }
};

/**
 * An input line that could not be turned into calls
 */
struct VcfParseIssue {
    int line_number = 0;
    std::string reason;
};

/**
 * Variant calls of one sample
 */
struct VariantSet {
    std::string sample;
    std::vector<VariantCall> calls;
    std::vector<VcfParseIssue> parse_issues;    // Lines dropped while loading
};

// ============================================================================
// Codon table
// ============================================================================

/**
 * Vertebrate mitochondrial codon table (NCBI translation table 2)
 */
class CodonTable {
public:
    /**
     * Translate a codon to amino acid
     * @param codon 3-letter DNA codon
     * @return Single-letter amino acid code, '*' for stop, '-' for an empty
     *         codon, or 'X' for unknown
     */
    static char translate(const std::string& codon);

    /**
     * Get three-letter amino acid code
     */
    static std::string get_three_letter(char aa);

    /**
     * Check if codon is a mitochondrial stop codon (TAA, TAG, AGA, AGG)
     */
    static bool is_stop_codon(const std::string& codon);

    /**
     * True if every base is one of A, C, G, T
     */
    static bool is_unambiguous(const std::string& codon);
};

// ============================================================================
// Reference sequence
// ============================================================================

/**
 * True for the contig names a mitochondrial reference goes by
 * (MT, M, chrM, chrMT, rCRS, RSRS)
 */
bool is_mito_contig(const std::string& chrom);

/**
 * Mitochondrial reference sequence (single contig, held in memory)
 */
class ReferenceSequence {
public:
    /**
     * @param name Contig name
     * @param sequence Nucleotides, uppercased on construction
     */
    ReferenceSequence(std::string name, std::string sequence);

    /**
     * Load the mitochondrial record from a FASTA file (.fa or .fa.gz).
     * Picks the first record with a mitochondrial name, or the only record.
     */
    static ReferenceSequence load(const std::string& fasta_path);

    const std::string& name() const { return name_; }
    const std::string& sequence() const { return sequence_; }
    int length() const { return static_cast<int>(sequence_.size()); }

    /**
     * Check that [start, end] (1-based, inclusive) lies inside the sequence
     */
    bool covers(int start, int end) const {
        return start >= 1 && end >= start && end <= length();
    }

    /**
     * Get sequence at a position
     * @return Uppercase sequence, empty if the span is not covered
     */
    std::string get_sequence(int start, int end) const;

    char get_base(int pos) const;

private:
    std::string name_;
    std::string sequence_;
};

/**
 * "rCRS" (bases 523-524 are AC), "RSRS" (NN) or "other"
 */
std::string detect_reference_build(const ReferenceSequence& reference);

// ============================================================================
// Genome annotation index
// ============================================================================

/**
 * Static table of annotated intervals supporting multi-hit overlap queries
 */
class GenomeAnnotationIndex {
public:
    /**
     * Build from loaded intervals
     * @throws ConfigurationError for empty tables or invalid coordinates
     */
    explicit GenomeAnnotationIndex(std::vector<GenomicInterval> intervals);

    /**
     * Load from an annotation table file (.tsv or .tsv.gz)
     */
    explicit GenomeAnnotationIndex(const std::string& table_path);

    ~GenomeAnnotationIndex();

    GenomeAnnotationIndex(const GenomeAnnotationIndex&) = delete;
    GenomeAnnotationIndex& operator=(const GenomeAnnotationIndex&) = delete;

    /**
     * All intervals containing pos, by start ascending, ties in table order
     */
    std::vector<const GenomicInterval*> overlaps(int pos) const;

    /**
     * Coding intervals only, same order as overlaps()
     */
    std::vector<const GenomicInterval*> coding_intervals() const;

    /**
     * Coding intervals containing pos
     */
    std::vector<const GenomicInterval*> coding_overlaps(int pos) const;

    /**
     * Gene names in index order, without duplicates
     */
    std::vector<std::string> genes() const;

    size_t size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

// ============================================================================
// Annotation context
// ============================================================================

/**
 * Immutable annotation index + reference, shared by every component of a run.
 * Built once by the caller before processing starts.
 */
class AnnotationContext {
public:
    /**
     * @throws ConfigurationError if either part is missing
     */
    AnnotationContext(std::shared_ptr<const GenomeAnnotationIndex> index,
                      std::shared_ptr<const ReferenceSequence> reference);

    /**
     * Load annotation table and reference FASTA
     */
    static AnnotationContext load(const std::string& annotation_path,
                                  const std::string& fasta_path);

    const GenomeAnnotationIndex& index() const { return *index_; }
    const ReferenceSequence& reference() const { return *reference_; }

private:
    std::shared_ptr<const GenomeAnnotationIndex> index_;
    std::shared_ptr<const ReferenceSequence> reference_;
};

// ============================================================================
// Region locator
// ============================================================================

/**
 * Maps variants to overlapping intervals and local coding coordinates.
 *
 * Multi-hit rule: the primary hit is the first interval returned by
 * GenomeAnnotationIndex::overlaps(). Gene, region, local coordinates and
 * codon indices all come from that hit; locals are only defined when it is a
 * coding interval. Locals are not strand-corrected.
 */
class RegionLocator {
public:
    explicit RegionLocator(AnnotationContext context);

    /**
     * Annotate a single call
     * @return nullopt when filter_low_quality is set and the call failed PASS
     */
    std::optional<AnnotatedVariant> locate(const VariantCall& call,
                                           bool filter_low_quality = false) const;

    /**
     * Re-locate an annotated variant; returned unchanged when all derived
     * fields are already present
     */
    std::optional<AnnotatedVariant> locate(const AnnotatedVariant& variant,
                                           bool filter_low_quality = false) const;

    /**
     * Batch form, preserves input order and omits filtered calls
     */
    std::vector<AnnotatedVariant> locate_all(const std::vector<VariantCall>& calls,
                                             bool filter_low_quality = false) const;

private:
    AnnotationContext context_;
};

// ============================================================================
// Variant decomposer
// ============================================================================

/**
 * Splits coding variants into codon-aligned reference/alternate pairs
 */
class VariantDecomposer {
public:
    explicit VariantDecomposer(AnnotationContext context);

    /**
     * One edit per affected codon; empty for non-coding variants
     * @throws UnsupportedReferenceError if the reference does not cover the
     *         affected codons
     */
    std::vector<DecomposedEdit> decompose(const AnnotatedVariant& variant) const;

    std::vector<DecomposedEdit> decompose_all(const std::vector<AnnotatedVariant>& variants) const;

private:
    AnnotationContext context_;
};

// ============================================================================
// Consequence predictor
// ============================================================================

/**
 * Classifies decomposed edits. Stateless.
 */
class ConsequencePredictor {
public:
    ConsequenceAnnotation predict(const DecomposedEdit& edit) const;

    std::vector<ConsequenceAnnotation> predict_all(const std::vector<DecomposedEdit>& edits) const;
};

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
void log(LogLevel level, const std::string& message);

} // namespace mtvep

#endif // MTVEP_ANNOTATOR_HPP
