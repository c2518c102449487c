#pragma once

#include <array>
#include <string>

#include "core/DataStructs.hpp"

namespace TrinucMatrix {

/// Number of trinucleotide substitution classes (4 x 6 x 4).
constexpr int kNumMotifClasses = 96;

/**
 * @brief Labels substitutions and maps them onto the 96 canonical classes.
 *
 * Substitutions are named by the pyrimidine (C or T) of the mutated
 * Watson-Crick pair, collapsing 12 raw substitutions onto 6 types:
 *
 *   A>G, T>C -> T>C     C>T, G>A -> C>T     A>T, T>A -> T>A
 *   A>C, T>G -> T>G     C>A, G>T -> C>A     C>G, G>C -> C>G
 *
 * The flanking bases are kept as they appear on the reference strand.
 */
class SubstitutionClassifier {
public:
    /**
     * @brief The 96 class labels in matrix column order: grouped by type
     *        (C>A, C>G, C>T, T>A, T>C, T>G), then 5' flank, then 3' flank.
     */
    static const std::array<std::string, kNumMotifClasses>& canonical_motifs();

    /**
     * @brief Column index of a canonical class label, or -1.
     */
    static int motif_index(const std::string& motif);

    /**
     * @brief Pyrimidine-normalized type of a raw or normalized label.
     *
     * Idempotent: normalize("C>T") == "C>T".
     * @return Empty string for anything that is not one of the 12 labels.
     */
    static std::string normalize(const std::string& substitution);

    /**
     * @brief "REF>ALT" exactly as observed.
     */
    static std::string substitution_label(const std::string& ref, const std::string& alt);

    /**
     * @brief Builds "X[REF>ALT]Y" from a 3-base context and a label.
     */
    static std::string motif_label(const std::string& trinucleotide, const std::string& substitution);

    /**
     * @brief Fills every field of a SubstitutionRecord.
     *
     * @param trinucleotide 3-base reference context; trinucleotide[1] is the reference base.
     * @throws std::invalid_argument if the context is not 3 bases or the
     *         substitution is not one of the 12 labels.
     */
    static SubstitutionRecord classify(const std::string& trinucleotide, const std::string& ref,
                                       const std::string& alt);
};

}  // namespace TrinucMatrix
