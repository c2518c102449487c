#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "utils/FastaReader.hpp"

using namespace TrinucMatrix;

// Test fixture writing a small FASTA; fai_load builds the .fai on first open
class FastaReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        fasta_path = (std::filesystem::temp_directory_path() / "trinuc_fasta_test.fa").string();
        std::ofstream ofs(fasta_path);
        ofs << ">chr1 test contig\n"
            << "GCTAAAGACAATTACATAAC\n"
            << "ATACACGTCAGCACGAAACT\n"
            << "TGTTGGCCCAGTGTGAATCG\n"
            << ">chr2\n"
            << "ttcaggatctgaaagat\n";
        ofs.close();
        std::remove((fasta_path + ".fai").c_str());
    }

    void TearDown() override {
        std::remove(fasta_path.c_str());
        std::remove((fasta_path + ".fai").c_str());
    }

    std::string fasta_path;
};

TEST_F(FastaReaderTest, OpensAndListsContigs) {
    FastaReader reader(fasta_path);
    EXPECT_TRUE(reader.is_loaded());
    EXPECT_EQ(reader.get_path(), fasta_path);

    auto contigs = reader.list_contigs();
    ASSERT_EQ(contigs.size(), 2u);
    EXPECT_EQ(contigs.count("chr1"), 1u);
    EXPECT_EQ(contigs.count("chr2"), 1u);

    EXPECT_EQ(reader.contig_length("chr1"), 60);
    EXPECT_EQ(reader.contig_length("chr2"), 17);
    EXPECT_EQ(reader.contig_length("chrM"), -1);
    EXPECT_FALSE(reader.has_contig("chrM"));
}

TEST_F(FastaReaderTest, FetchesOneBasedInclusiveAcrossLines) {
    FastaReader reader(fasta_path);

    EXPECT_EQ(reader.get_sequence("chr1", 1, 3), "GCT");
    EXPECT_EQ(reader.get_sequence("chr1", 24, 26), "CAC");
    EXPECT_EQ(reader.get_sequence("chr1", 19, 22), "ACAT");
}

TEST_F(FastaReaderTest, UppercasesSoftMaskedBases) {
    FastaReader reader(fasta_path);
    EXPECT_EQ(reader.get_sequence("chr2", 2, 4), "TCA");
}

TEST_F(FastaReaderTest, TruncatesAtContigEnd) {
    FastaReader reader(fasta_path);
    EXPECT_EQ(reader.get_sequence("chr1", 58, 70), "TCG");
}

TEST_F(FastaReaderTest, UnknownContigOrBadRangeGivesEmpty) {
    FastaReader reader(fasta_path);
    EXPECT_EQ(reader.get_sequence("chr9", 1, 10), "");
    EXPECT_EQ(reader.get_sequence("chr1", 0, 10), "");
    EXPECT_EQ(reader.get_sequence("chr1", 10, 5), "");
}

TEST_F(FastaReaderTest, MoveTransfersIndex) {
    FastaReader a(fasta_path);
    FastaReader b(std::move(a));
    EXPECT_FALSE(a.is_loaded());
    EXPECT_TRUE(b.is_loaded());
    EXPECT_EQ(b.get_sequence("chr1", 1, 3), "GCT");
}

TEST(FastaReaderErrorTest, MissingFileThrows) {
    EXPECT_THROW(FastaReader("/nonexistent/trinuc_missing.fa"), std::runtime_error);
}
