/**
 * mtvep - Mitochondrial Variant Annotator - Core implementation
 */

#include "mt_annotator.hpp"
#include "file_parsers.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <unordered_map>
#include <unordered_set>

namespace mtvep {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    // Single insertion so lines from worker threads do not interleave
    std::ostringstream line;
    std::tm local_tm;
    localtime_r(&time_t_now, &local_tm);
    line << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
         << " - " << level_str << " - " << message << '\n';
    std::cerr << line.str() << std::flush;
}

// ============================================================================
// Region / consequence utilities
// ============================================================================

std::string region_to_string(RegionClass region) {
    switch (region) {
        case RegionClass::CODING:    return "coding";
        case RegionClass::TRNA:      return "tRNA";
        case RegionClass::RRNA:      return "rRNA";
        case RegionClass::CONTROL:   return "control";
        case RegionClass::NONCODING: return "noncoding";
        default:                     return "noncoding";
    }
}

std::optional<RegionClass> parse_region(const std::string& tag) {
    std::string lower = tag;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "coding" || lower == "protein_coding" || lower == "cds") return RegionClass::CODING;
    if (lower == "trna" || lower == "mt_trna") return RegionClass::TRNA;
    if (lower == "rrna" || lower == "mt_rrna") return RegionClass::RRNA;
    if (lower == "control" || lower == "d-loop" || lower == "dloop") return RegionClass::CONTROL;
    if (lower == "noncoding" || lower == "non-coding") return RegionClass::NONCODING;
    return std::nullopt;
}

std::string consequence_to_string(ConsequenceClass type) {
    switch (type) {
        case ConsequenceClass::SYNONYMOUS:  return "synonymous";
        case ConsequenceClass::MISSENSE:    return "missense";
        case ConsequenceClass::NONSENSE:    return "nonsense";
        case ConsequenceClass::READTHROUGH: return "readthrough";
        case ConsequenceClass::FRAMESHIFT:  return "frameshift";
        case ConsequenceClass::UNKNOWN:     return "unknown";
        default:                            return "unknown";
    }
}

// ============================================================================
// Variant helpers
// ============================================================================

std::string variant_type(const VariantCall& call) {
    return call.ref_allele.size() == call.alt_allele.size() ? "SNV" : "indel";
}

std::string position_string(const VariantCall& call) {
    if (call.ref_allele.size() <= 1) {
        return std::to_string(call.pos);
    }
    return std::to_string(call.pos) + "_" + std::to_string(call.end());
}

std::string impact_key(const VariantCall& call) {
    return call.chrom + ":" + std::to_string(call.pos) + call.ref_allele + ">" + call.alt_allele;
}

bool AnnotatedVariant::has_derived_fields() const {
    return gene.has_value() && region.has_value() &&
           local_start.has_value() && local_end.has_value() &&
           start_codon.has_value() && end_codon.has_value();
}

std::string AnnotatedVariant::overlap_genes_string() const {
    std::string result;
    for (size_t i = 0; i < overlap_genes.size(); ++i) {
        if (i > 0) result += ",";
        result += overlap_genes[i];
    }
    return result;
}

std::string ConsequenceAnnotation::protein_change() const {
    const std::string pos = std::to_string(protein_position());

    switch (consequence) {
        case ConsequenceClass::UNKNOWN:
            return "p.?";
        case ConsequenceClass::FRAMESHIFT:
            if (ref_aa == '-') return "p." + pos + "fs";
            return "p." + CodonTable::get_three_letter(ref_aa) + pos + "fs";
        case ConsequenceClass::SYNONYMOUS:
            return "p." + CodonTable::get_three_letter(ref_aa) + pos + "=";
        default:
            break;
    }

    if (ref_aa == '-') {
        return "p." + pos + "ins" + CodonTable::get_three_letter(alt_aa);
    }
    if (alt_aa == '-') {
        return "p." + CodonTable::get_three_letter(ref_aa) + pos + "del";
    }
    return "p." + CodonTable::get_three_letter(ref_aa) + pos + CodonTable::get_three_letter(alt_aa);
}

// ============================================================================
// Codon Table
// ============================================================================

char CodonTable::translate(const std::string& codon) {
    // NCBI translation table 2 (vertebrate mitochondrial)
    static const std::unordered_map<std::string, char> table = {
        {"TTT", 'F'}, {"TTC", 'F'}, {"TTA", 'L'}, {"TTG", 'L'},
        {"CTT", 'L'}, {"CTC", 'L'}, {"CTA", 'L'}, {"CTG", 'L'},
        {"ATT", 'I'}, {"ATC", 'I'}, {"ATA", 'M'}, {"ATG", 'M'},
        {"GTT", 'V'}, {"GTC", 'V'}, {"GTA", 'V'}, {"GTG", 'V'},
        {"TCT", 'S'}, {"TCC", 'S'}, {"TCA", 'S'}, {"TCG", 'S'},
        {"CCT", 'P'}, {"CCC", 'P'}, {"CCA", 'P'}, {"CCG", 'P'},
        {"ACT", 'T'}, {"ACC", 'T'}, {"ACA", 'T'}, {"ACG", 'T'},
        {"GCT", 'A'}, {"GCC", 'A'}, {"GCA", 'A'}, {"GCG", 'A'},
        {"TAT", 'Y'}, {"TAC", 'Y'}, {"TAA", '*'}, {"TAG", '*'},
        {"CAT", 'H'}, {"CAC", 'H'}, {"CAA", 'Q'}, {"CAG", 'Q'},
        {"AAT", 'N'}, {"AAC", 'N'}, {"AAA", 'K'}, {"AAG", 'K'},
        {"GAT", 'D'}, {"GAC", 'D'}, {"GAA", 'E'}, {"GAG", 'E'},
        {"TGT", 'C'}, {"TGC", 'C'}, {"TGA", 'W'}, {"TGG", 'W'},
        {"CGT", 'R'}, {"CGC", 'R'}, {"CGA", 'R'}, {"CGG", 'R'},
        {"AGT", 'S'}, {"AGC", 'S'}, {"AGA", '*'}, {"AGG", '*'},
        {"GGT", 'G'}, {"GGC", 'G'}, {"GGA", 'G'}, {"GGG", 'G'}
    };

    if (codon.empty()) return '-';
    if (codon.length() != 3) return 'X';

    std::string upper_codon = codon;
    std::transform(upper_codon.begin(), upper_codon.end(), upper_codon.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto it = table.find(upper_codon);
    return (it != table.end()) ? it->second : 'X';
}

std::string CodonTable::get_three_letter(char aa) {
    static const std::unordered_map<char, std::string> table = {
        {'A', "Ala"}, {'R', "Arg"}, {'N', "Asn"}, {'D', "Asp"},
        {'C', "Cys"}, {'E', "Glu"}, {'Q', "Gln"}, {'G', "Gly"},
        {'H', "His"}, {'I', "Ile"}, {'L', "Leu"}, {'K', "Lys"},
        {'M', "Met"}, {'F', "Phe"}, {'P', "Pro"}, {'S', "Ser"},
        {'T', "Thr"}, {'W', "Trp"}, {'Y', "Tyr"}, {'V', "Val"},
        {'*', "Ter"}, {'X', "Xaa"}
    };

    auto it = table.find(aa);
    return (it != table.end()) ? it->second : "Xaa";
}

bool CodonTable::is_stop_codon(const std::string& codon) {
    std::string upper = codon;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == "TAA" || upper == "TAG" || upper == "AGA" || upper == "AGG";
}

bool CodonTable::is_unambiguous(const std::string& codon) {
    return std::all_of(codon.begin(), codon.end(), [](char c) {
        char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return upper == 'A' || upper == 'C' || upper == 'G' || upper == 'T';
    });
}

// ============================================================================
// ReferenceSequence
// ============================================================================

bool is_mito_contig(const std::string& chrom) {
    static const std::unordered_set<std::string> aliases = {
        "MT", "M", "chrM", "chrMT", "rCRS", "RSRS"
    };
    return aliases.count(chrom) > 0;
}

ReferenceSequence::ReferenceSequence(std::string name, std::string sequence)
    : name_(std::move(name)), sequence_(std::move(sequence)) {
    if (sequence_.empty()) {
        throw ConfigurationError("Reference sequence '" + name_ + "' is empty");
    }
    std::transform(sequence_.begin(), sequence_.end(), sequence_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
}

ReferenceSequence ReferenceSequence::load(const std::string& fasta_path) {
    log(LogLevel::INFO, "Loading reference sequence from: " + fasta_path);

    GzLineReader reader(fasta_path);

    std::vector<std::pair<std::string, std::string>> records;
    std::string line;

    while (reader.next(line)) {
        if (line.empty()) continue;

        if (line[0] == '>') {
            size_t space_pos = line.find_first_of(" \t");
            records.emplace_back(line.substr(1, space_pos == std::string::npos ? std::string::npos : space_pos - 1),
                                 std::string());
            records.back().second.reserve(16569);
        } else {
            if (records.empty()) {
                throw ConfigurationError("FASTA file has sequence data before the first header: " + fasta_path);
            }
            records.back().second += line;
        }
    }

    if (records.empty()) {
        throw ConfigurationError("No sequences in FASTA file: " + fasta_path);
    }

    // Prefer the mitochondrial record in multi-contig references
    auto chosen = records.begin();
    if (records.size() > 1) {
        chosen = std::find_if(records.begin(), records.end(),
                              [](const std::pair<std::string, std::string>& record) {
                                  return is_mito_contig(record.first);
                              });
        if (chosen == records.end()) {
            throw ConfigurationError("No mitochondrial record among " +
                                     std::to_string(records.size()) + " sequences in " + fasta_path);
        }
    }

    ReferenceSequence reference(chosen->first, std::move(chosen->second));
    log(LogLevel::INFO, "Loaded reference " + reference.name() + " (" +
        std::to_string(reference.length()) + " bp)");
    return reference;
}

std::string ReferenceSequence::get_sequence(int start, int end) const {
    if (!covers(start, end)) return "";
    return sequence_.substr(static_cast<size_t>(start - 1), static_cast<size_t>(end - start + 1));
}

char ReferenceSequence::get_base(int pos) const {
    std::string seq = get_sequence(pos, pos);
    return seq.empty() ? 'N' : seq[0];
}

std::string detect_reference_build(const ReferenceSequence& reference) {
    std::string marker = reference.get_sequence(523, 524);
    if (marker == "AC") return "rCRS";
    if (marker == "NN") return "RSRS";
    return "other";
}

// ============================================================================
// GenomeAnnotationIndex implementation
// ============================================================================

struct GenomeAnnotationIndex::Impl {
    std::vector<GenomicInterval> intervals;     // Sorted by start, ties in table order
    IntervalTree<size_t> tree;

    void build(std::vector<GenomicInterval> input) {
        if (input.empty()) {
            throw ConfigurationError("Annotation table contains no intervals");
        }
        for (const auto& interval : input) {
            if (interval.start < 1 || interval.end < interval.start) {
                throw ConfigurationError("Invalid interval for " + interval.gene + ": " +
                                         std::to_string(interval.start) + "-" +
                                         std::to_string(interval.end));
            }
        }

        std::stable_sort(input.begin(), input.end(),
                         [](const GenomicInterval& a, const GenomicInterval& b) {
                             return a.start < b.start;
                         });
        intervals = std::move(input);

        for (size_t i = 0; i < intervals.size(); ++i) {
            tree.insert(intervals[i].start, intervals[i].end, i);
        }
        tree.build();
    }
};

GenomeAnnotationIndex::GenomeAnnotationIndex(std::vector<GenomicInterval> intervals)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->build(std::move(intervals));
}

GenomeAnnotationIndex::GenomeAnnotationIndex(const std::string& table_path)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->build(load_annotation_table(table_path));
}

GenomeAnnotationIndex::~GenomeAnnotationIndex() = default;

std::vector<const GenomicInterval*> GenomeAnnotationIndex::overlaps(int pos) const {
    auto hits = pimpl_->tree.query(pos);

    // Index order is start order with table order for ties
    std::sort(hits.begin(), hits.end());

    std::vector<const GenomicInterval*> result;
    result.reserve(hits.size());
    for (size_t idx : hits) {
        result.push_back(&pimpl_->intervals[idx]);
    }
    return result;
}

std::vector<const GenomicInterval*> GenomeAnnotationIndex::coding_intervals() const {
    std::vector<const GenomicInterval*> result;
    for (const auto& interval : pimpl_->intervals) {
        if (interval.region == RegionClass::CODING) {
            result.push_back(&interval);
        }
    }
    return result;
}

std::vector<const GenomicInterval*> GenomeAnnotationIndex::coding_overlaps(int pos) const {
    auto hits = overlaps(pos);
    hits.erase(std::remove_if(hits.begin(), hits.end(),
                              [](const GenomicInterval* interval) {
                                  return interval->region != RegionClass::CODING;
                              }),
               hits.end());
    return hits;
}

std::vector<std::string> GenomeAnnotationIndex::genes() const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& interval : pimpl_->intervals) {
        if (seen.insert(interval.gene).second) {
            result.push_back(interval.gene);
        }
    }
    return result;
}

size_t GenomeAnnotationIndex::size() const {
    return pimpl_->intervals.size();
}

// ============================================================================
// AnnotationContext
// ============================================================================

AnnotationContext::AnnotationContext(std::shared_ptr<const GenomeAnnotationIndex> index,
                                     std::shared_ptr<const ReferenceSequence> reference)
    : index_(std::move(index)), reference_(std::move(reference)) {
    if (!index_) {
        throw ConfigurationError("Annotation context requires an annotation index");
    }
    if (!reference_) {
        throw ConfigurationError("Annotation context requires a reference sequence");
    }
}

AnnotationContext AnnotationContext::load(const std::string& annotation_path,
                                          const std::string& fasta_path) {
    auto index = std::make_shared<const GenomeAnnotationIndex>(annotation_path);
    auto reference = std::make_shared<const ReferenceSequence>(ReferenceSequence::load(fasta_path));
    return AnnotationContext(std::move(index), std::move(reference));
}

// ============================================================================
// RegionLocator
// ============================================================================

RegionLocator::RegionLocator(AnnotationContext context)
    : context_(std::move(context)) {}

std::optional<AnnotatedVariant> RegionLocator::locate(const VariantCall& call,
                                                      bool filter_low_quality) const {
    AnnotatedVariant variant;
    variant.call = call;
    return locate(variant, filter_low_quality);
}

std::optional<AnnotatedVariant> RegionLocator::locate(const AnnotatedVariant& variant,
                                                      bool filter_low_quality) const {
    if (filter_low_quality && !variant.call.pass_filter) {
        return std::nullopt;
    }

    // Already located
    if (variant.has_derived_fields()) {
        return variant;
    }

    AnnotatedVariant result = variant;
    result.gene.reset();
    result.region.reset();
    result.overlap_genes.clear();
    result.local_start.reset();
    result.local_end.reset();
    result.start_codon.reset();
    result.end_codon.reset();

    auto hits = context_.index().overlaps(variant.call.pos);
    if (hits.empty()) {
        return result;
    }

    const GenomicInterval* primary = hits.front();
    result.gene = primary->gene;
    result.region = primary->region;

    if (hits.size() > 1) {
        for (const auto* hit : hits) {
            result.overlap_genes.push_back(hit->gene);
        }
    }

    if (primary->region == RegionClass::CODING) {
        int local_start = variant.call.pos - primary->start;
        int local_end = variant.call.end() - primary->start;
        if (local_end < local_start) local_end = local_start;

        result.local_start = local_start;
        result.local_end = local_end;
        result.start_codon = local_start / 3;
        result.end_codon = local_end / 3;
    }

    return result;
}

std::vector<AnnotatedVariant> RegionLocator::locate_all(const std::vector<VariantCall>& calls,
                                                        bool filter_low_quality) const {
    std::vector<AnnotatedVariant> result;
    result.reserve(calls.size());
    for (const auto& call : calls) {
        auto located = locate(call, filter_low_quality);
        if (located) {
            result.push_back(std::move(*located));
        }
    }
    return result;
}

// ============================================================================
// VariantDecomposer
// ============================================================================

VariantDecomposer::VariantDecomposer(AnnotationContext context)
    : context_(std::move(context)) {}

std::vector<DecomposedEdit> VariantDecomposer::decompose(const AnnotatedVariant& variant) const {
    std::vector<DecomposedEdit> edits;

    if (!variant.is_coding() || !variant.gene || !variant.start_codon || !variant.end_codon) {
        return edits;
    }

    const ReferenceSequence& reference = context_.reference();
    const VariantCall& call = variant.call;

    // Gene anchor recovered from the local offset
    const int gene_start = call.pos - *variant.local_start;
    const int first_codon = *variant.start_codon;
    const int last_codon = *variant.end_codon;
    const int window_start = gene_start + first_codon * 3;
    const int window_end = gene_start + last_codon * 3 + 2;

    if (!reference.covers(window_start, window_end)) {
        throw UnsupportedReferenceError(
            "Reference " + reference.name() + " (" + std::to_string(reference.length()) +
            " bp) does not cover codons " + std::to_string(first_codon) + "-" +
            std::to_string(last_codon) + " of " + *variant.gene);
    }

    const std::string ref_window = reference.get_sequence(window_start, window_end);
    const size_t offset = static_cast<size_t>(call.pos - window_start);
    const size_t ref_span = call.ref_allele.size();

    if (offset + ref_span > ref_window.size()) {
        throw MalformedVariantError("Reference allele of " + impact_key(call) +
                                    " extends past codon " + std::to_string(last_codon));
    }

    std::string edited = ref_window.substr(0, offset) + call.alt_allele +
                         ref_window.substr(offset + ref_span);

    const long length_change = static_cast<long>(call.alt_allele.size()) - static_cast<long>(ref_span);
    const bool frameshift = length_change % 3 != 0;

    // Complete the last alternate codon with downstream reference bases
    if (edited.size() % 3 != 0) {
        int missing = 3 - static_cast<int>(edited.size() % 3);
        int tail_end = std::min(window_end + missing, reference.length());
        if (tail_end > window_end) {
            edited += reference.get_sequence(window_end + 1, tail_end);
        }
        edited.resize(edited.size() - edited.size() % 3);
    }

    const size_t ref_codons = ref_window.size() / 3;
    const size_t alt_codons = edited.size() / 3;
    const size_t n_edits = std::max(ref_codons, alt_codons);

    edits.reserve(n_edits);
    for (size_t i = 0; i < n_edits; ++i) {
        DecomposedEdit edit;
        edit.gene = *variant.gene;
        edit.codon_index = first_codon + static_cast<int>(i);
        edit.ref_codon = i < ref_codons ? ref_window.substr(i * 3, 3) : "";
        edit.alt_codon = i < alt_codons ? edited.substr(i * 3, 3) : "";
        edit.frameshift = frameshift;
        edits.push_back(std::move(edit));
    }

    return edits;
}

std::vector<DecomposedEdit> VariantDecomposer::decompose_all(
    const std::vector<AnnotatedVariant>& variants
) const {
    std::vector<DecomposedEdit> result;
    for (const auto& variant : variants) {
        auto edits = decompose(variant);
        result.insert(result.end(),
                      std::make_move_iterator(edits.begin()),
                      std::make_move_iterator(edits.end()));
    }
    return result;
}

// ============================================================================
// ConsequencePredictor
// ============================================================================

ConsequenceAnnotation ConsequencePredictor::predict(const DecomposedEdit& edit) const {
    ConsequenceAnnotation ann;
    ann.gene = edit.gene;
    ann.codon_index = edit.codon_index;
    ann.ref_codon = edit.ref_codon;
    ann.alt_codon = edit.alt_codon;
    ann.ref_aa = CodonTable::translate(edit.ref_codon);
    ann.alt_aa = CodonTable::translate(edit.alt_codon);

    auto well_formed = [](const std::string& codon) {
        return codon.empty() || (codon.size() == 3 && CodonTable::is_unambiguous(codon));
    };

    if (!well_formed(edit.ref_codon) || !well_formed(edit.alt_codon) ||
        (edit.ref_codon.empty() && edit.alt_codon.empty())) {
        ann.consequence = ConsequenceClass::UNKNOWN;
    } else if (edit.frameshift) {
        ann.consequence = ConsequenceClass::FRAMESHIFT;
    } else if (ann.ref_aa == ann.alt_aa) {
        ann.consequence = ConsequenceClass::SYNONYMOUS;
    } else if (ann.alt_aa == '*') {
        ann.consequence = ConsequenceClass::NONSENSE;
    } else if (ann.ref_aa == '*') {
        ann.consequence = ConsequenceClass::READTHROUGH;
    } else {
        ann.consequence = ConsequenceClass::MISSENSE;
    }

    return ann;
}

std::vector<ConsequenceAnnotation> ConsequencePredictor::predict_all(
    const std::vector<DecomposedEdit>& edits
) const {
    std::vector<ConsequenceAnnotation> result;
    result.reserve(edits.size());
    for (const auto& edit : edits) {
        result.push_back(predict(edit));
    }
    return result;
}

} // namespace mtvep
