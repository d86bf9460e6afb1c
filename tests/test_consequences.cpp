/**
 * Tests for ConsequencePredictor: classification precedence and protein
 * change notation
 */

#include <gtest/gtest.h>
#include "mt_annotator.hpp"
#include "test_fixtures.hpp"

using namespace mtvep;
using namespace mtvep::fixtures;

namespace {

DecomposedEdit make_edit(int codon_index, const std::string& ref, const std::string& alt,
                         bool frameshift = false) {
    DecomposedEdit edit;
    edit.gene = "MT-ND1";
    edit.codon_index = codon_index;
    edit.ref_codon = ref;
    edit.alt_codon = alt;
    edit.frameshift = frameshift;
    return edit;
}

std::vector<ConsequenceAnnotation> annotate(const VariantCall& call) {
    auto context = mito_context();
    RegionLocator locator(context);
    VariantDecomposer decomposer(context);
    ConsequencePredictor predictor;

    auto located = locator.locate(call);
    if (!located) return {};
    return predictor.predict_all(decomposer.decompose(*located));
}

} // anonymous namespace

// ============================================================================
// Classification
// ============================================================================

TEST(ConsequencePredictor, Synonymous) {
    ConsequencePredictor predictor;
    auto ann = predictor.predict(make_edit(5, "CTT", "CTC"));
    EXPECT_EQ(ann.consequence, ConsequenceClass::SYNONYMOUS);
    EXPECT_EQ(ann.ref_aa, 'L');
    EXPECT_EQ(ann.alt_aa, 'L');
}

TEST(ConsequencePredictor, Missense) {
    ConsequencePredictor predictor;
    auto ann = predictor.predict(make_edit(0, "ATA", "ACA"));
    EXPECT_EQ(ann.consequence, ConsequenceClass::MISSENSE);
    EXPECT_EQ(ann.ref_aa, 'M');
    EXPECT_EQ(ann.alt_aa, 'T');
}

TEST(ConsequencePredictor, NonsenseUsesMitochondrialStops) {
    ConsequencePredictor predictor;
    EXPECT_EQ(predictor.predict(make_edit(6, "CAA", "TAA")).consequence, ConsequenceClass::NONSENSE);
    // CGA (Arg) -> AGA (mitochondrial stop)
    EXPECT_EQ(predictor.predict(make_edit(6, "CGA", "AGA")).consequence, ConsequenceClass::NONSENSE);
}

TEST(ConsequencePredictor, TgaIsNotAStop) {
    ConsequencePredictor predictor;
    auto ann = predictor.predict(make_edit(11, "TGG", "TGA"));
    EXPECT_EQ(ann.consequence, ConsequenceClass::SYNONYMOUS);
    EXPECT_EQ(ann.alt_aa, 'W');
}

TEST(ConsequencePredictor, Readthrough) {
    ConsequencePredictor predictor;
    auto ann = predictor.predict(make_edit(7, "AGA", "CGA"));
    EXPECT_EQ(ann.consequence, ConsequenceClass::READTHROUGH);
    EXPECT_EQ(ann.ref_aa, '*');
    EXPECT_EQ(ann.alt_aa, 'R');
}

TEST(ConsequencePredictor, StopToStopIsSynonymous) {
    ConsequencePredictor predictor;
    EXPECT_EQ(predictor.predict(make_edit(7, "AGA", "TAG")).consequence, ConsequenceClass::SYNONYMOUS);
}

TEST(ConsequencePredictor, FrameshiftTakesPrecedence) {
    ConsequencePredictor predictor;
    // Would be synonymous without the frameshift flag
    EXPECT_EQ(predictor.predict(make_edit(5, "CTT", "CTC", true)).consequence,
              ConsequenceClass::FRAMESHIFT);
    EXPECT_EQ(predictor.predict(make_edit(6, "", "ACA", true)).consequence,
              ConsequenceClass::FRAMESHIFT);
}

TEST(ConsequencePredictor, AmbiguousBasesAreUnknown) {
    ConsequencePredictor predictor;
    auto ann = predictor.predict(make_edit(6, "CAA", "NAA"));
    EXPECT_EQ(ann.consequence, ConsequenceClass::UNKNOWN);
    EXPECT_EQ(ann.alt_aa, 'X');

    // Unknown wins over the frameshift flag
    EXPECT_EQ(predictor.predict(make_edit(6, "CAA", "CRA", true)).consequence,
              ConsequenceClass::UNKNOWN);
}

TEST(ConsequencePredictor, MalformedCodonsAreUnknown) {
    ConsequencePredictor predictor;
    EXPECT_EQ(predictor.predict(make_edit(1, "CA", "CAA")).consequence, ConsequenceClass::UNKNOWN);
    EXPECT_EQ(predictor.predict(make_edit(1, "", "")).consequence, ConsequenceClass::UNKNOWN);
}

TEST(ConsequencePredictor, InFrameIndelCodons) {
    ConsequencePredictor predictor;

    auto inserted = predictor.predict(make_edit(6, "", "GGG"));
    EXPECT_EQ(inserted.ref_aa, '-');
    EXPECT_EQ(inserted.alt_aa, 'G');
    EXPECT_EQ(inserted.consequence, ConsequenceClass::MISSENSE);

    auto deleted = predictor.predict(make_edit(6, "CAA", ""));
    EXPECT_EQ(deleted.alt_aa, '-');
    EXPECT_EQ(deleted.consequence, ConsequenceClass::MISSENSE);

    auto deleted_stop = predictor.predict(make_edit(7, "AGA", ""));
    EXPECT_EQ(deleted_stop.consequence, ConsequenceClass::READTHROUGH);
}

TEST(ConsequencePredictor, CarriesEditFields) {
    ConsequencePredictor predictor;
    auto ann = predictor.predict(make_edit(10, "GCC", "GCA"));
    EXPECT_EQ(ann.gene, "MT-ND1");
    EXPECT_EQ(ann.codon_index, 10);
    EXPECT_EQ(ann.protein_position(), 11);
    EXPECT_EQ(ann.ref_codon, "GCC");
    EXPECT_EQ(ann.alt_codon, "GCA");
}

TEST(ConsequencePredictor, PredictAllKeepsOrder) {
    ConsequencePredictor predictor;
    auto anns = predictor.predict_all({make_edit(10, "GCC", "GCA"), make_edit(11, "TGG", "AGG")});
    ASSERT_EQ(anns.size(), 2u);
    EXPECT_EQ(anns[0].consequence, ConsequenceClass::SYNONYMOUS);
    EXPECT_EQ(anns[1].consequence, ConsequenceClass::NONSENSE);
}

// ============================================================================
// Protein change notation
// ============================================================================

TEST(ProteinChange, Notation) {
    ConsequencePredictor predictor;
    EXPECT_EQ(predictor.predict(make_edit(5, "CTT", "CTC")).protein_change(), "p.Leu6=");
    EXPECT_EQ(predictor.predict(make_edit(6, "CAA", "TAA")).protein_change(), "p.Gln7Ter");
    EXPECT_EQ(predictor.predict(make_edit(0, "ATA", "ACA")).protein_change(), "p.Met1Thr");
    EXPECT_EQ(predictor.predict(make_edit(7, "AGA", "CGA")).protein_change(), "p.Ter8Arg");
    EXPECT_EQ(predictor.predict(make_edit(5, "CTT", "CTC", true)).protein_change(), "p.Leu6fs");
    EXPECT_EQ(predictor.predict(make_edit(6, "", "ACA", true)).protein_change(), "p.7fs");
    EXPECT_EQ(predictor.predict(make_edit(6, "", "GGG")).protein_change(), "p.7insGly");
    EXPECT_EQ(predictor.predict(make_edit(6, "CAA", "")).protein_change(), "p.Gln7del");
    EXPECT_EQ(predictor.predict(make_edit(6, "CAA", "NAA")).protein_change(), "p.?");
}

TEST(ConsequenceClass, Names) {
    EXPECT_EQ(consequence_to_string(ConsequenceClass::SYNONYMOUS), "synonymous");
    EXPECT_EQ(consequence_to_string(ConsequenceClass::MISSENSE), "missense");
    EXPECT_EQ(consequence_to_string(ConsequenceClass::NONSENSE), "nonsense");
    EXPECT_EQ(consequence_to_string(ConsequenceClass::READTHROUGH), "readthrough");
    EXPECT_EQ(consequence_to_string(ConsequenceClass::FRAMESHIFT), "frameshift");
    EXPECT_EQ(consequence_to_string(ConsequenceClass::UNKNOWN), "unknown");
}

// ============================================================================
// End to end through locate and decompose
// ============================================================================

TEST(ConsequencePipeline, SynonymousLeucine) {
    auto anns = annotate(make_call(3324, "T", "C"));
    ASSERT_EQ(anns.size(), 1u);
    EXPECT_EQ(anns[0].ref_codon, "CTT");
    EXPECT_EQ(anns[0].alt_codon, "CTC");
    EXPECT_EQ(anns[0].consequence, ConsequenceClass::SYNONYMOUS);
    EXPECT_EQ(anns[0].protein_change(), "p.Leu6=");
}

TEST(ConsequencePipeline, NonsenseGlutamine) {
    auto anns = annotate(make_call(3325, "C", "T"));
    ASSERT_EQ(anns.size(), 1u);
    EXPECT_EQ(anns[0].ref_codon, "CAA");
    EXPECT_EQ(anns[0].alt_codon, "TAA");
    EXPECT_EQ(anns[0].consequence, ConsequenceClass::NONSENSE);
    EXPECT_EQ(anns[0].protein_change(), "p.Gln7Ter");
}

TEST(ConsequencePipeline, ReadthroughOfAgaStop) {
    auto anns = annotate(make_call(3328, "A", "C"));
    ASSERT_EQ(anns.size(), 1u);
    EXPECT_EQ(anns[0].consequence, ConsequenceClass::READTHROUGH);
}

TEST(ConsequencePipeline, MnvTwoCodons) {
    auto anns = annotate(make_call(3339, "CT", "AA"));
    ASSERT_EQ(anns.size(), 2u);
    EXPECT_EQ(anns[0].consequence, ConsequenceClass::SYNONYMOUS);
    EXPECT_EQ(anns[1].consequence, ConsequenceClass::NONSENSE);
    EXPECT_EQ(anns[1].protein_change(), "p.Trp12Ter");
}

TEST(ConsequencePipeline, FrameshiftDeletion) {
    auto anns = annotate(make_call(3323, "TT", "T"));
    ASSERT_EQ(anns.size(), 1u);
    EXPECT_EQ(anns[0].consequence, ConsequenceClass::FRAMESHIFT);
    EXPECT_EQ(anns[0].protein_change(), "p.Leu6fs");
}
