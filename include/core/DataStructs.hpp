#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Types.hpp"

namespace TrinucMatrix {

/**
 * @brief One somatic variant as read from a MAF row.
 */
struct Variant {
    std::string sample_id;               ///< Tumor_Sample_Barcode
    std::string contig;                  ///< Chromosome
    int64_t position = 0;                ///< Start_Position (1-based)
    int64_t end_position = 0;            ///< End_Position (1-based, == position for SNVs)
    std::string reference_allele;        ///< Reference_Allele
    std::string alternate_allele;        ///< Tumor_Seq_Allele2
    std::string variant_type;            ///< Variant_Type (SNP, DNP, INS, DEL, ...)
    std::string variant_classification;  ///< Variant_Classification (Missense_Mutation, Silent, ...)
};

/**
 * @brief Reference sequence around one variant plus background composition.
 *
 * background covers [position - 20, end_position + 20], clipped to the
 * contig. Motif counts are step-1 and overlapping.
 */
struct SequenceContext {
    std::string trinucleotide;  ///< 5' flank, reference base, 3' flank
    std::string background;     ///< Background window (41 bp for an SNV away from contig ends)

    int64_t count_a = 0;
    int64_t count_c = 0;
    int64_t count_g = 0;
    int64_t count_t = 0;

    int64_t count_tca = 0;
    int64_t count_tct = 0;
    int64_t count_aga = 0;
    int64_t count_tga = 0;

    int64_t tcw() const { return count_tca + count_tct; }
    int64_t wga() const { return count_tga + count_aga; }
};

/**
 * @brief Substitution labels of a variant in raw and pyrimidine orientation.
 */
struct SubstitutionRecord {
    std::string substitution;             ///< "G>A" exactly as observed
    std::string substitution_type;        ///< "C>T" pyrimidine-normalized
    std::string substitution_motif;       ///< "T[G>A]A" raw orientation
    std::string substitution_type_motif;  ///< "T[C>T]A" one of the 96 canonical classes
};

/**
 * @brief A variant that survived context extraction, with its labels.
 */
struct ClassifiedVariant {
    std::string sample_id;
    std::string contig;
    int64_t position = 0;
    SequenceContext context;
    SubstitutionRecord record;
};

/**
 * @brief A variant whose reference base does not match the genome.
 */
struct ContextMismatch {
    std::string sample_id;
    std::string contig;
    int64_t position = 0;
    std::string expected;  ///< Reference_Allele from the input
    std::string observed;  ///< Trinucleotide fetched from the reference (may be short at contig ends)
};

/**
 * @brief Structured account of everything the pipeline dropped.
 *
 * Each warning category carries counts and identifiers so callers can
 * inspect them without parsing log output.
 */
struct PipelineDiagnostics {
    // Variant preparation
    size_t input_variants = 0;          ///< Rows in the main table
    size_t silent_pool_variants = 0;    ///< Rows in the silent pool
    size_t silent_removed = 0;          ///< Main-table rows dropped for a silent classification
    size_t synonymous_added = 0;        ///< Silent-pool rows appended (include_synonymous)
    size_t ignored_contig_variants = 0; ///< Rows dropped by ignore_contigs
    size_t non_snp_removed = 0;         ///< Rows whose Variant_Type is not SNP
    size_t malformed_alleles = 0;       ///< SNP rows with alleles outside A/C/G/T or REF == ALT
    size_t prepared_variants = 0;       ///< SNVs handed to context extraction

    // Contig mismatch
    std::vector<std::string> missing_contigs;  ///< Variant contigs absent from the reference (sorted)
    size_t missing_contig_variants = 0;        ///< Variants dropped on those contigs

    // Context integrity
    std::vector<ContextMismatch> context_mismatches;

    size_t classified_variants = 0;  ///< Variants that reached aggregation
    size_t undefined_ratio_samples = 0;

    bool has_warnings() const {
        return !missing_contigs.empty() || !context_mismatches.empty();
    }
};

}  // namespace TrinucMatrix
