#include "core/Aggregator.hpp"

#include <numeric>
#include <stdexcept>

namespace TrinucMatrix {

int64_t SampleAggregate::substitution(const std::string& label) const {
    auto it = substitution_counts.find(label);
    return it == substitution_counts.end() ? 0 : it->second;
}

int64_t SampleAggregate::motif(const std::string& label) const {
    auto it = motif_counts.find(label);
    return it == motif_counts.end() ? 0 : it->second;
}

int64_t SampleAggregate::n_a() const {
    return substitution("A>C") + substitution("A>G") + substitution("A>T");
}

int64_t SampleAggregate::n_c() const {
    return substitution("C>A") + substitution("C>G") + substitution("C>T");
}

int64_t SampleAggregate::n_g() const {
    return substitution("G>A") + substitution("G>C") + substitution("G>T");
}

int64_t SampleAggregate::n_t() const {
    return substitution("T>A") + substitution("T>C") + substitution("T>G");
}

int64_t SampleAggregate::apobec_mutations() const {
    return (substitution("C>G") + substitution("G>C")) + substitution("C>T") + substitution("G>A");
}

int64_t SampleAggregate::tcw_wga_mutations() const {
    return motif("T[C>G]T") + motif("T[C>G]A") + motif("T[C>T]T") + motif("T[C>T]A") + motif("T[G>C]A") +
           motif("A[G>C]A") + motif("T[G>A]A") + motif("A[G>A]A");
}

int64_t SampleAggregate::classified_mutations() const {
    return std::accumulate(type_motif_counts.begin(), type_motif_counts.end(), int64_t{0});
}

void Aggregator::add(const ClassifiedVariant& variant) {
    const int col = SubstitutionClassifier::motif_index(variant.record.substitution_type_motif);
    if (col < 0) {
        throw std::invalid_argument("Not a canonical trinucleotide class: " + variant.record.substitution_type_motif);
    }

    SampleAggregate& agg = samples_[variant.sample_id];
    agg.sample_id = variant.sample_id;

    const SequenceContext& ctx = variant.context;
    agg.bg_a += ctx.count_a;
    agg.bg_c += ctx.count_c;
    agg.bg_g += ctx.count_g;
    agg.bg_t += ctx.count_t;
    agg.bg_tcw += ctx.tcw();
    agg.bg_wga += ctx.wga();

    agg.substitution_counts[variant.record.substitution]++;
    agg.motif_counts[variant.record.substitution_motif]++;
    agg.type_motif_counts[col]++;
}

}  // namespace TrinucMatrix
