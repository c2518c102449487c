#include "core/SubstitutionClassifier.hpp"

#include <map>
#include <stdexcept>
#include <unordered_map>

namespace TrinucMatrix {

const std::array<std::string, kNumMotifClasses>& SubstitutionClassifier::canonical_motifs() {
    static const std::array<std::string, kNumMotifClasses> motifs = {
        "A[C>A]A", "A[C>A]C", "A[C>A]G", "A[C>A]T", "C[C>A]A", "C[C>A]C",
        "C[C>A]G", "C[C>A]T", "G[C>A]A", "G[C>A]C", "G[C>A]G", "G[C>A]T",
        "T[C>A]A", "T[C>A]C", "T[C>A]G", "T[C>A]T", "A[C>G]A", "A[C>G]C",
        "A[C>G]G", "A[C>G]T", "C[C>G]A", "C[C>G]C", "C[C>G]G", "C[C>G]T",
        "G[C>G]A", "G[C>G]C", "G[C>G]G", "G[C>G]T", "T[C>G]A", "T[C>G]C",
        "T[C>G]G", "T[C>G]T", "A[C>T]A", "A[C>T]C", "A[C>T]G", "A[C>T]T",
        "C[C>T]A", "C[C>T]C", "C[C>T]G", "C[C>T]T", "G[C>T]A", "G[C>T]C",
        "G[C>T]G", "G[C>T]T", "T[C>T]A", "T[C>T]C", "T[C>T]G", "T[C>T]T",
        "A[T>A]A", "A[T>A]C", "A[T>A]G", "A[T>A]T", "C[T>A]A", "C[T>A]C",
        "C[T>A]G", "C[T>A]T", "G[T>A]A", "G[T>A]C", "G[T>A]G", "G[T>A]T",
        "T[T>A]A", "T[T>A]C", "T[T>A]G", "T[T>A]T", "A[T>C]A", "A[T>C]C",
        "A[T>C]G", "A[T>C]T", "C[T>C]A", "C[T>C]C", "C[T>C]G", "C[T>C]T",
        "G[T>C]A", "G[T>C]C", "G[T>C]G", "G[T>C]T", "T[T>C]A", "T[T>C]C",
        "T[T>C]G", "T[T>C]T", "A[T>G]A", "A[T>G]C", "A[T>G]G", "A[T>G]T",
        "C[T>G]A", "C[T>G]C", "C[T>G]G", "C[T>G]T", "G[T>G]A", "G[T>G]C",
        "G[T>G]G", "G[T>G]T", "T[T>G]A", "T[T>G]C", "T[T>G]G", "T[T>G]T"};
    return motifs;
}

int SubstitutionClassifier::motif_index(const std::string& motif) {
    static const std::unordered_map<std::string, int> index = [] {
        std::unordered_map<std::string, int> m;
        const auto& motifs = canonical_motifs();
        for (int i = 0; i < kNumMotifClasses; ++i) {
            m.emplace(motifs[i], i);
        }
        return m;
    }();

    auto it = index.find(motif);
    return it == index.end() ? -1 : it->second;
}

std::string SubstitutionClassifier::normalize(const std::string& substitution) {
    static const std::map<std::string, std::string> conv = {
        {"A>G", "T>C"}, {"T>C", "T>C"}, {"C>T", "C>T"}, {"G>A", "C>T"},
        {"A>T", "T>A"}, {"T>A", "T>A"}, {"A>C", "T>G"}, {"T>G", "T>G"},
        {"C>A", "C>A"}, {"G>T", "C>A"}, {"C>G", "C>G"}, {"G>C", "C>G"}};

    auto it = conv.find(substitution);
    return it == conv.end() ? std::string() : it->second;
}

std::string SubstitutionClassifier::substitution_label(const std::string& ref, const std::string& alt) {
    return ref + ">" + alt;
}

std::string SubstitutionClassifier::motif_label(const std::string& trinucleotide, const std::string& substitution) {
    std::string label;
    label.reserve(7);
    label += trinucleotide[0];
    label += '[';
    label += substitution;
    label += ']';
    label += trinucleotide[2];
    return label;
}

SubstitutionRecord SubstitutionClassifier::classify(const std::string& trinucleotide, const std::string& ref,
                                                    const std::string& alt) {
    if (trinucleotide.size() != 3) {
        throw std::invalid_argument("Trinucleotide context must be 3 bases, got '" + trinucleotide + "'");
    }

    SubstitutionRecord record;
    record.substitution = substitution_label(ref, alt);
    record.substitution_type = normalize(record.substitution);
    if (record.substitution_type.empty()) {
        throw std::invalid_argument("Unknown substitution '" + record.substitution + "'");
    }
    record.substitution_motif = motif_label(trinucleotide, record.substitution);
    record.substitution_type_motif = motif_label(trinucleotide, record.substitution_type);
    return record;
}

}  // namespace TrinucMatrix
