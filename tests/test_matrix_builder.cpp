#include <gtest/gtest.h>

#include <array>
#include <map>
#include <stdexcept>

#include "core/MatrixBuilder.hpp"

using namespace TrinucMatrix;

TEST(MatrixBuilderTest, SingleMutationGivesOneHotRow) {
    MatrixBuilder builder;
    builder.add_count("S1", "T[C>T]A");
    builder.finalize();

    const SignatureMatrix& m = builder.get_matrix();
    ASSERT_EQ(m.num_samples(), 1);
    ASSERT_EQ(m.num_classes(), 96);
    ASSERT_EQ(m.counts.rows(), 1);
    ASSERT_EQ(m.counts.cols(), 96);

    const int col = SubstitutionClassifier::motif_index("T[C>T]A");
    int zeros = 0;
    for (int c = 0; c < 96; ++c) {
        if (c == col) {
            EXPECT_EQ(m.counts(0, c), 1);
        } else if (m.counts(0, c) == 0) {
            zeros++;
        }
    }
    EXPECT_EQ(zeros, 95);
}

TEST(MatrixBuilderTest, ColumnsFollowCanonicalOrder) {
    MatrixBuilder builder;
    builder.add_count("S1", "A[C>A]A");
    builder.finalize();

    const SignatureMatrix& m = builder.get_matrix();
    const auto& motifs = SubstitutionClassifier::canonical_motifs();
    for (int c = 0; c < 96; ++c) {
        EXPECT_EQ(m.motifs[static_cast<size_t>(c)], motifs[c]);
    }
}

TEST(MatrixBuilderTest, RowsKeepInsertionOrderAndAccumulate) {
    MatrixBuilder builder;
    builder.add_count("S2", "T[C>G]T", 2);
    builder.add_count("S1", "C[T>A]G");
    builder.add_count("S2", "T[C>G]T");
    builder.finalize();

    const SignatureMatrix& m = builder.get_matrix();
    ASSERT_EQ(m.num_samples(), 2);
    EXPECT_EQ(m.sample_ids[0], "S2");
    EXPECT_EQ(m.row_of("S1"), 1);
    EXPECT_EQ(m.row_of("S3"), -1);
    EXPECT_EQ(m.counts(0, SubstitutionClassifier::motif_index("T[C>G]T")), 3);
    EXPECT_EQ(m.counts.row(0).sum(), 3);
    EXPECT_EQ(m.counts.row(1).sum(), 1);
}

TEST(MatrixBuilderTest, RowSumsMatchAggregates) {
    std::map<std::string, SampleAggregate> samples;
    SampleAggregate a;
    a.sample_id = "A";
    a.type_motif_counts[0] = 4;
    a.type_motif_counts[50] = 1;
    SampleAggregate b;
    b.sample_id = "B";
    b.type_motif_counts[95] = 7;
    samples["A"] = a;
    samples["B"] = b;

    MatrixBuilder builder;
    builder.add_aggregates(samples);
    builder.finalize();

    const SignatureMatrix& m = builder.get_matrix();
    ASSERT_EQ(m.num_samples(), 2);
    EXPECT_EQ(m.counts.row(m.row_of("A")).sum(), a.classified_mutations());
    EXPECT_EQ(m.counts.row(m.row_of("B")).sum(), 7);
    EXPECT_EQ(m.counts(m.row_of("B"), 95), 7);
}

TEST(MatrixBuilderTest, UnknownClassRejected) {
    MatrixBuilder builder;
    EXPECT_THROW(builder.add_count("S1", "T[G>A]A"), std::invalid_argument);
}

TEST(MatrixBuilderTest, LifecycleErrors) {
    MatrixBuilder builder;
    EXPECT_THROW(builder.get_matrix(), std::runtime_error);

    builder.add_count("S1", "T[C>T]A");
    builder.finalize();
    builder.finalize();  // no-op
    EXPECT_EQ(builder.get_matrix().num_samples(), 1);
    EXPECT_THROW(builder.add_count("S2", "T[C>T]A"), std::runtime_error);

    builder.clear();
    EXPECT_EQ(builder.num_samples(), 0);
    builder.add_count("S2", "T[C>T]A");
    builder.finalize();
    EXPECT_EQ(builder.get_matrix().sample_ids[0], "S2");
}

TEST(MatrixBuilderTest, EmptyMatrixStillHas96Columns) {
    MatrixBuilder builder;
    builder.finalize();

    const SignatureMatrix& m = builder.get_matrix();
    EXPECT_EQ(m.num_samples(), 0);
    EXPECT_EQ(m.num_classes(), 96);
    EXPECT_EQ(m.counts.cols(), 96);
}
