/**
 * Shared fixtures: a 16569 bp mitochondrial reference with a handful of
 * annotated genes laid out at their rCRS coordinates.
 */

#ifndef MTVEP_TEST_FIXTURES_HPP
#define MTVEP_TEST_FIXTURES_HPP

#include "mt_annotator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mtvep {
namespace fixtures {

constexpr int kMitoLength = 16569;

// ND1 (coding, +): 3307-4262
constexpr int kND1Start = 3307;
constexpr int kND1End = 4262;

// Filler bases; tests overwrite the codons they depend on
inline std::string patterned_sequence(int length) {
    static const std::string unit =
        "GATCACAGGTCTATCACCCTATTAACCACTCACGGGAGCTCTCCATGCATTTGGTATTTT";
    std::string seq;
    seq.reserve(static_cast<size_t>(length));
    while (static_cast<int>(seq.size()) < length) {
        seq += unit;
    }
    seq.resize(static_cast<size_t>(length));
    return seq;
}

// Overwrite bases at a 1-based position
inline void set_bases(std::string& seq, int pos, const std::string& bases) {
    seq.replace(static_cast<size_t>(pos - 1), bases.size(), bases);
}

inline GenomicInterval make_interval(const std::string& gene, int start, int end,
                                     RegionClass region, char strand = '+') {
    GenomicInterval interval;
    interval.chrom = "chrM";
    interval.start = start;
    interval.end = end;
    interval.strand = strand;
    interval.gene = gene;
    interval.region = region;
    return interval;
}

inline std::vector<GenomicInterval> mito_intervals() {
    return {
        make_interval("D-loop", 1, 576, RegionClass::CONTROL),
        make_interval("MT-RNR1", 648, 1601, RegionClass::RRNA),
        make_interval("MT-TL1", 3230, 3304, RegionClass::TRNA),
        make_interval("MT-ND1", kND1Start, kND1End, RegionClass::CODING),
        make_interval("MT-ATP8", 8366, 8572, RegionClass::CODING),
        make_interval("MT-ATP6", 8527, 9207, RegionClass::CODING),
        make_interval("MT-ND6", 14149, 14673, RegionClass::CODING, '-'),
        make_interval("D-loop", 16024, 16569, RegionClass::CONTROL),
    };
}

/**
 * Reference with known ND1 codons:
 *   codon 0 (3307-3309) ATA   Met (mitochondrial start)
 *   codon 5 (3322-3324) CTT   Leu
 *   codon 6 (3325-3327) CAA   Gln
 *   codon 7 (3328-3330) AGA   Ter
 *   codon 10 (3337-3339) GCC  Ala
 *   codon 11 (3340-3342) TGG  Trp
 * and "AC" at 523-524 so the build is detected as rCRS.
 */
inline std::string mito_sequence() {
    std::string seq = patterned_sequence(kMitoLength);
    set_bases(seq, 523, "AC");
    set_bases(seq, 3307, "ATA");
    set_bases(seq, 3322, "CTT");
    set_bases(seq, 3325, "CAA");
    set_bases(seq, 3328, "AGA");
    set_bases(seq, 3337, "GCC");
    set_bases(seq, 3340, "TGG");
    return seq;
}

inline AnnotationContext make_context(std::vector<GenomicInterval> intervals,
                                      std::string sequence) {
    return AnnotationContext(
        std::make_shared<const GenomeAnnotationIndex>(std::move(intervals)),
        std::make_shared<const ReferenceSequence>("chrM", std::move(sequence)));
}

inline AnnotationContext mito_context() {
    return make_context(mito_intervals(), mito_sequence());
}

inline VariantCall make_call(int pos, const std::string& ref, const std::string& alt,
                             bool pass = true, const std::string& chrom = "chrM") {
    VariantCall call;
    call.chrom = chrom;
    call.pos = pos;
    call.ref_allele = ref;
    call.alt_allele = alt;
    call.depth = 100;
    call.alt_depth = 95;
    call.pass_filter = pass;
    return call;
}

} // namespace fixtures
} // namespace mtvep

#endif // MTVEP_TEST_FIXTURES_HPP
