/**
 * @file test_enrichment_scorer.cpp
 * @brief Unit tests for the APOBEC enrichment ratio and the one-sided exact test
 *
 * Reference values for exact_enrichment_test were obtained with the
 * conditional maximum-likelihood estimator and the "greater" alternative.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

#include "core/EnrichmentScorer.hpp"

using namespace TrinucMatrix;

namespace {

SampleAggregate make_aggregate(const std::string& id, int64_t apobec, int64_t tcw_wga, int64_t bg_c, int64_t bg_tcw) {
    SampleAggregate a;
    a.sample_id = id;
    a.substitution_counts["C>T"] = apobec;
    a.motif_counts["T[C>T]A"] = tcw_wga;
    a.motif_counts["A[C>T]G"] = apobec - tcw_wga;
    a.bg_c = bg_c;
    a.bg_tcw = bg_tcw;
    return a;
}

}  // namespace

// ============================================================================
// Exact test
// ============================================================================

TEST(ExactEnrichmentTest, SmallTableReferenceValues) {
    ExactTestResult r = exact_enrichment_test({1, 9, 1, 1});

    EXPECT_NEAR(r.p_value, 65.0 / 66.0, 1e-10);
    EXPECT_NEAR(r.odds_ratio, 0.149071198, 1e-6);
    EXPECT_NEAR(r.ci_low, 0.002616179, 1e-6);
    EXPECT_TRUE(std::isinf(r.ci_high));
}

TEST(ExactEnrichmentTest, EnrichedTableReferenceValues) {
    ExactTestResult r = exact_enrichment_test({8, 2, 5, 15});

    EXPECT_NEAR(r.p_value, 0.00623973727, 1e-9);
    EXPECT_NEAR(r.odds_ratio, 10.83437365, 1e-5);
    EXPECT_NEAR(r.ci_low, 1.912335404, 1e-5);
    EXPECT_TRUE(std::isinf(r.ci_high));
}

TEST(ExactEnrichmentTest, ConfidenceLevelMovesLowerBound) {
    ExactTestResult r95 = exact_enrichment_test({8, 2, 5, 15}, 0.95);
    ExactTestResult r99 = exact_enrichment_test({8, 2, 5, 15}, 0.99);

    EXPECT_DOUBLE_EQ(r95.p_value, r99.p_value);
    EXPECT_DOUBLE_EQ(r95.odds_ratio, r99.odds_ratio);
    EXPECT_LT(r99.ci_low, r95.ci_low);
}

TEST(ExactEnrichmentTest, ZeroTopLeftCell) {
    ExactTestResult r = exact_enrichment_test({0, 5, 10, 10});

    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
    EXPECT_DOUBLE_EQ(r.odds_ratio, 0.0);
    EXPECT_DOUBLE_EQ(r.ci_low, 0.0);
}

TEST(ExactEnrichmentTest, AllZeroTable) {
    ExactTestResult r = exact_enrichment_test({0, 0, 0, 0});

    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
    EXPECT_TRUE(std::isinf(r.ci_high));
}

TEST(ExactEnrichmentTest, MaximalTopLeftCellGivesInfiniteOddsRatio) {
    ExactTestResult r = exact_enrichment_test({5, 0, 3, 10});

    EXPECT_TRUE(std::isinf(r.odds_ratio));
    EXPECT_LT(r.p_value, 0.01);
    EXPECT_GT(r.ci_low, 1.0);
}

TEST(ExactEnrichmentTest, RejectsInvalidInput) {
    EXPECT_THROW(exact_enrichment_test({-1, 2, 3, 4}), std::invalid_argument);
    EXPECT_THROW(exact_enrichment_test({1, 2, 3, 4}, 1.0), std::invalid_argument);
    EXPECT_THROW(exact_enrichment_test({1, 2, 3, 4}, 0.0), std::invalid_argument);
}

// ============================================================================
// Ratio and table
// ============================================================================

TEST(EnrichmentRatioTest, RatioOfFractions) {
    SampleAggregate a = make_aggregate("S", 10, 5, 100, 10);
    EXPECT_DOUBLE_EQ(apobec_enrichment_ratio(a), 5.0);

    ContingencyTable t = enrichment_table(a);
    EXPECT_EQ(t.a, 5);
    EXPECT_EQ(t.b, 5);
    EXPECT_EQ(t.c, 110);
    EXPECT_EQ(t.d, 90);
}

TEST(EnrichmentRatioTest, UndefinedWithoutApobecMutations) {
    SampleAggregate a = make_aggregate("S", 0, 0, 100, 10);
    a.substitution_counts["T>A"] = 4;
    EXPECT_TRUE(std::isnan(apobec_enrichment_ratio(a)));
}

TEST(EnrichmentRatioTest, UndefinedWithoutBackgroundC) {
    SampleAggregate a = make_aggregate("S", 10, 5, 0, 0);
    EXPECT_TRUE(std::isnan(apobec_enrichment_ratio(a)));
}

TEST(EnrichmentRatioTest, InfiniteWithoutBackgroundMotif) {
    SampleAggregate a = make_aggregate("S", 10, 5, 100, 0);
    EXPECT_TRUE(std::isinf(apobec_enrichment_ratio(a)));
}

// ============================================================================
// Scorer
// ============================================================================

TEST(EnrichmentScorerTest, LabelsUseThreshold) {
    std::map<std::string, SampleAggregate> samples;
    samples["high"] = make_aggregate("high", 10, 5, 100, 10);    // 5.0
    samples["edge"] = make_aggregate("edge", 10, 2, 100, 10);    // 2.0, not above
    samples["none"] = make_aggregate("none", 0, 0, 100, 10);     // undefined

    EnrichmentScorer scorer;
    auto results = scorer.score(samples);
    ASSERT_EQ(results.size(), 3u);

    std::map<std::string, EnrichmentResult> by_id;
    for (const auto& r : results) {
        by_id[r.sample_id] = r;
    }

    EXPECT_TRUE(by_id["high"].enriched);
    EXPECT_DOUBLE_EQ(by_id["edge"].apobec_enrichment_ratio, 2.0);
    EXPECT_FALSE(by_id["edge"].enriched);
    EXPECT_FALSE(by_id["none"].ratio_defined());
    EXPECT_FALSE(by_id["none"].enriched);
}

TEST(EnrichmentScorerTest, SortedByAscendingPValue) {
    std::map<std::string, SampleAggregate> samples;
    samples["a_weak"] = make_aggregate("a_weak", 10, 1, 10, 5);     // table (1, 9, 15, 5)
    samples["b_strong"] = make_aggregate("b_strong", 10, 8, 10, 1); // table (8, 2, 11, 9)
    samples["c_mid"] = make_aggregate("c_mid", 10, 4, 10, 3);

    EnrichmentScorer scorer(0.95, 2);
    auto results = scorer.score(samples);
    ASSERT_EQ(results.size(), 3u);

    EXPECT_EQ(results[0].sample_id, "b_strong");
    EXPECT_EQ(results[2].sample_id, "a_weak");
    for (size_t i = 1; i < results.size(); ++i) {
        EXPECT_LE(results[i - 1].test.p_value, results[i].test.p_value);
    }
}

TEST(EnrichmentScorerTest, ResultCarriesAggregate) {
    std::map<std::string, SampleAggregate> samples;
    samples["S"] = make_aggregate("S", 10, 5, 100, 10);

    EnrichmentScorer scorer;
    auto results = scorer.score(samples);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].aggregate.apobec_mutations(), 10);
    EXPECT_EQ(results[0].aggregate.tcw_wga_mutations(), 5);
}

TEST(EnrichmentScorerTest, EmptyInput) {
    EnrichmentScorer scorer;
    EXPECT_TRUE(scorer.score({}).empty());
}

TEST(EnrichmentRatioTest, UniformBackgroundExample) {
    SampleAggregate a;
    a.sample_id = "S";
    a.bg_a = a.bg_c = a.bg_g = a.bg_t = 10;
    a.bg_tcw = 2;
    a.substitution_counts["C>G"] = 1;
    a.substitution_counts["C>T"] = 1;
    a.motif_counts["T[C>G]A"] = 1;
    a.motif_counts["T[C>T]T"] = 1;

    EXPECT_EQ(a.tcw_to_g(), 1);
    EXPECT_EQ(a.tcw_to_t(), 1);
    EXPECT_EQ(a.apobec_mutations(), 2);
    EXPECT_DOUBLE_EQ(apobec_enrichment_ratio(a), 5.0);
}
