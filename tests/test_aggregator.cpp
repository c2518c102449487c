#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "core/Aggregator.hpp"
#include "core/SubstitutionClassifier.hpp"

using namespace TrinucMatrix;

class AggregatorTest : public ::testing::Test {
protected:
    static ClassifiedVariant make_classified(const std::string& sample, const std::string& tri, const std::string& ref,
                                             const std::string& alt) {
        ClassifiedVariant cv;
        cv.sample_id = sample;
        cv.contig = "chr1";
        cv.position = 100;
        cv.context.trinucleotide = tri;
        cv.context.count_a = 8;
        cv.context.count_c = 10;
        cv.context.count_g = 12;
        cv.context.count_t = 11;
        cv.context.count_tca = 1;
        cv.context.count_tct = 1;
        cv.context.count_aga = 2;
        cv.context.count_tga = 0;
        cv.record = SubstitutionClassifier::classify(tri, ref, alt);
        return cv;
    }

    void SetUp() override {
        variants = {make_classified("S1", "TCA", "C", "T"),   // tCw, APOBEC
                    make_classified("S1", "TGA", "G", "A"),   // wGa, APOBEC
                    make_classified("S1", "ACG", "C", "T"),   // APOBEC type, not tCw
                    make_classified("S1", "TCT", "C", "A"),   // tCw but C>A
                    make_classified("S1", "ATA", "T", "C"),
                    make_classified("S2", "TCA", "C", "G")};
    }

    std::vector<ClassifiedVariant> variants;
};

TEST_F(AggregatorTest, GroupsBySample) {
    Aggregator agg;
    agg.add_all(variants);

    ASSERT_EQ(agg.num_samples(), 2u);
    EXPECT_EQ(agg.samples().at("S1").sample_id, "S1");
    EXPECT_EQ(agg.samples().at("S1").n_mutations(), 5);
    EXPECT_EQ(agg.samples().at("S2").n_mutations(), 1);
}

TEST_F(AggregatorTest, SubstitutionAndMotifCounts) {
    Aggregator agg;
    agg.add_all(variants);
    const SampleAggregate& s1 = agg.samples().at("S1");

    EXPECT_EQ(s1.substitution("C>T"), 2);
    EXPECT_EQ(s1.substitution("G>A"), 1);
    EXPECT_EQ(s1.substitution("C>A"), 1);
    EXPECT_EQ(s1.substitution("T>C"), 1);
    EXPECT_EQ(s1.substitution("A>G"), 0);

    EXPECT_EQ(s1.n_c(), 3);
    EXPECT_EQ(s1.n_g(), 1);
    EXPECT_EQ(s1.n_t(), 1);
    EXPECT_EQ(s1.n_a(), 0);

    EXPECT_EQ(s1.motif("T[C>T]A"), 1);
    EXPECT_EQ(s1.motif("T[G>A]A"), 1);
    EXPECT_EQ(s1.motif("T[C>A]T"), 1);
    EXPECT_EQ(s1.motif("G[C>A]T"), 0);
}

TEST_F(AggregatorTest, ApobecDerivedCounts) {
    Aggregator agg;
    agg.add_all(variants);
    const SampleAggregate& s1 = agg.samples().at("S1");

    EXPECT_EQ(s1.apobec_mutations(), 3);
    EXPECT_EQ(s1.tcw_to_t(), 1);
    EXPECT_EQ(s1.tcw_to_a(), 1);
    EXPECT_EQ(s1.tcw_to_g(), 0);
    EXPECT_EQ(s1.tcw(), 2);
    EXPECT_EQ(s1.wga_to_a(), 1);
    EXPECT_EQ(s1.wga(), 1);
    EXPECT_EQ(s1.tcw_wga_mutations(), 2);
    EXPECT_EQ(s1.non_apobec_mutations(), 3);

    const SampleAggregate& s2 = agg.samples().at("S2");
    EXPECT_EQ(s2.apobec_mutations(), 1);
    EXPECT_EQ(s2.tcw_to_g(), 1);
    EXPECT_EQ(s2.tcw_wga_mutations(), 1);
}

TEST_F(AggregatorTest, BackgroundSummedPerSample) {
    Aggregator agg;
    agg.add_all(variants);
    const SampleAggregate& s1 = agg.samples().at("S1");

    EXPECT_EQ(s1.bg_a, 40);
    EXPECT_EQ(s1.bg_c, 50);
    EXPECT_EQ(s1.bg_g, 60);
    EXPECT_EQ(s1.bg_t, 55);
    EXPECT_EQ(s1.bg_tcw, 10);
    EXPECT_EQ(s1.bg_wga, 10);
    EXPECT_EQ(s1.bg_bases(), 205);
}

TEST_F(AggregatorTest, CanonicalRowSumsToMutationCount) {
    Aggregator agg;
    agg.add_all(variants);

    for (const auto& kv : agg.samples()) {
        EXPECT_EQ(kv.second.classified_mutations(), kv.second.n_mutations()) << kv.first;
    }

    const SampleAggregate& s1 = agg.samples().at("S1");
    // G>A at TGA is counted in the C>T column with its flanks
    EXPECT_EQ(s1.type_motif_counts[SubstitutionClassifier::motif_index("T[C>T]A")], 2);
}

TEST_F(AggregatorTest, RejectsNonCanonicalClass) {
    ClassifiedVariant cv = variants[0];
    cv.record.substitution_type_motif = "N[C>T]A";

    Aggregator agg;
    EXPECT_THROW(agg.add(cv), std::invalid_argument);
    EXPECT_EQ(agg.num_samples(), 0u);
}
