/**
 * Tests for RegionLocator: primary hit selection, local coordinates,
 * quality filtering, idempotence
 */

#include <gtest/gtest.h>
#include "mt_annotator.hpp"
#include "test_fixtures.hpp"

using namespace mtvep;
using namespace mtvep::fixtures;

// ============================================================================
// Coding hits
// ============================================================================

TEST(RegionLocator, CodingSnvLocalCoordinates) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(3308, "T", "C"));

    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->gene, std::optional<std::string>("MT-ND1"));
    EXPECT_EQ(located->region, RegionClass::CODING);
    EXPECT_EQ(located->local_start, 1);
    EXPECT_EQ(located->local_end, 1);
    EXPECT_EQ(located->start_codon, 0);
    EXPECT_EQ(located->end_codon, 0);
    EXPECT_TRUE(located->overlap_genes.empty());
    EXPECT_TRUE(located->is_coding());
    EXPECT_TRUE(located->has_derived_fields());
}

TEST(RegionLocator, FirstBaseOfGene) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(kND1Start, "A", "G"));

    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->local_start, 0);
    EXPECT_EQ(located->start_codon, 0);
}

TEST(RegionLocator, MultiBaseSpansCodons) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(3339, "CT", "AA"));

    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->local_start, 32);
    EXPECT_EQ(located->local_end, 33);
    EXPECT_EQ(located->start_codon, 10);
    EXPECT_EQ(located->end_codon, 11);
}

TEST(RegionLocator, InsertionKeepsLocalEnd) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(3324, "T", "TAA"));

    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->local_start, 17);
    EXPECT_EQ(located->local_end, 17);
}

TEST(RegionLocator, CodonIndicesFollowLocals) {
    RegionLocator locator(mito_context());
    for (int pos = kND1Start; pos < kND1Start + 60; ++pos) {
        auto located = locator.locate(make_call(pos, "N", "A"));
        ASSERT_TRUE(located.has_value());
        ASSERT_TRUE(located->is_coding());
        EXPECT_EQ(*located->start_codon, *located->local_start / 3) << "pos " << pos;
        EXPECT_EQ(*located->end_codon, *located->local_end / 3) << "pos " << pos;
    }
}

// ============================================================================
// Non-coding hits
// ============================================================================

TEST(RegionLocator, TrnaHasNoLocals) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(3243, "A", "G"));

    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->gene, std::optional<std::string>("MT-TL1"));
    EXPECT_EQ(located->region, RegionClass::TRNA);
    EXPECT_FALSE(located->local_start.has_value());
    EXPECT_FALSE(located->start_codon.has_value());
    EXPECT_FALSE(located->is_coding());
}

TEST(RegionLocator, ControlRegion) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(16519, "T", "C"));

    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->gene, std::optional<std::string>("D-loop"));
    EXPECT_EQ(located->region, RegionClass::CONTROL);
}

TEST(RegionLocator, GapBetweenGenes) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(3305, "A", "G"));

    ASSERT_TRUE(located.has_value());
    EXPECT_FALSE(located->gene.has_value());
    EXPECT_FALSE(located->region.has_value());
    EXPECT_FALSE(located->local_start.has_value());
    EXPECT_FALSE(located->start_codon.has_value());
    EXPECT_TRUE(located->overlap_genes.empty());
}

// ============================================================================
// Overlapping genes
// ============================================================================

TEST(RegionLocator, OverlapUsesEarliestStart) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(8530, "A", "G"));

    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->gene, std::optional<std::string>("MT-ATP8"));
    EXPECT_EQ(located->overlap_genes, (std::vector<std::string>{"MT-ATP8", "MT-ATP6"}));
    EXPECT_EQ(located->overlap_genes_string(), "MT-ATP8,MT-ATP6");

    // Locals relative to ATP8 (8366)
    EXPECT_EQ(located->local_start, 164);
    EXPECT_EQ(located->start_codon, 54);
}

TEST(RegionLocator, NonCodingPrimaryHidesCodingSecondary) {
    auto context = make_context(
        {make_interval("MT-TX", 100, 200, RegionClass::TRNA),
         make_interval("MT-CX", 150, 300, RegionClass::CODING)},
        patterned_sequence(400));
    RegionLocator locator(context);

    auto located = locator.locate(make_call(160, "A", "G"));
    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->gene, std::optional<std::string>("MT-TX"));
    EXPECT_EQ(located->region, RegionClass::TRNA);
    EXPECT_FALSE(located->local_start.has_value());
    EXPECT_FALSE(located->is_coding());
}

TEST(RegionLocator, MinusStrandNotReoriented) {
    RegionLocator locator(mito_context());
    auto located = locator.locate(make_call(14150, "A", "G"));

    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->gene, std::optional<std::string>("MT-ND6"));
    EXPECT_EQ(located->local_start, 1);
}

// ============================================================================
// Quality filter
// ============================================================================

TEST(RegionLocator, FilterDropsFailedCalls) {
    RegionLocator locator(mito_context());
    auto failed = make_call(3308, "T", "C", false);

    EXPECT_FALSE(locator.locate(failed, true).has_value());
    EXPECT_TRUE(locator.locate(failed, false).has_value());
    EXPECT_TRUE(locator.locate(make_call(3308, "T", "C", true), true).has_value());
}

TEST(RegionLocator, LocateAllPreservesOrder) {
    RegionLocator locator(mito_context());
    std::vector<VariantCall> calls = {
        make_call(8530, "A", "G"),
        make_call(3308, "T", "C", false),
        make_call(3243, "A", "G"),
        make_call(3305, "A", "G"),
    };

    auto all = locator.locate_all(calls);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].call.pos, 8530);
    EXPECT_EQ(all[1].call.pos, 3308);
    EXPECT_EQ(all[3].call.pos, 3305);

    auto filtered = locator.locate_all(calls, true);
    ASSERT_EQ(filtered.size(), 3u);
    EXPECT_EQ(filtered[0].call.pos, 8530);
    EXPECT_EQ(filtered[1].call.pos, 3243);
    EXPECT_EQ(filtered[2].call.pos, 3305);
}

// ============================================================================
// Idempotence
// ============================================================================

TEST(RegionLocator, RelocateIsIdentity) {
    RegionLocator locator(mito_context());
    for (int pos : {3308, 8530, 3243, 3305, 16519}) {
        auto once = locator.locate(make_call(pos, "A", "G"));
        ASSERT_TRUE(once.has_value());
        auto twice = locator.locate(*once);
        ASSERT_TRUE(twice.has_value());
        EXPECT_EQ(*twice, *once) << "pos " << pos;
    }
}

TEST(RegionLocator, CompleteVariantReturnedUnchanged) {
    RegionLocator locator(mito_context());
    AnnotatedVariant variant;
    variant.call = make_call(3308, "T", "C");
    variant.gene = "CUSTOM";
    variant.region = RegionClass::CODING;
    variant.local_start = 7;
    variant.local_end = 7;
    variant.start_codon = 2;
    variant.end_codon = 2;

    auto located = locator.locate(variant);
    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(*located, variant);
}

TEST(RegionLocator, PartialVariantRecomputed) {
    RegionLocator locator(mito_context());
    AnnotatedVariant variant;
    variant.call = make_call(3308, "T", "C");
    variant.gene = "STALE";

    auto located = locator.locate(variant);
    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->gene, std::optional<std::string>("MT-ND1"));
    EXPECT_EQ(located->local_start, 1);
}
