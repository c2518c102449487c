#include "core/MatrixBuilder.hpp"

#include <stdexcept>

#include "utils/Logger.hpp"

namespace TrinucMatrix {

int SignatureMatrix::row_of(const std::string& sample_id) const {
    for (size_t i = 0; i < sample_ids.size(); ++i) {
        if (sample_ids[i] == sample_id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int MatrixBuilder::row_for(const std::string& sample_id) {
    if (finalized_) {
        throw std::runtime_error("MatrixBuilder: Cannot add samples after finalize()");
    }

    auto it = sample_rows_.find(sample_id);
    if (it != sample_rows_.end()) {
        return it->second;
    }

    int row = static_cast<int>(sample_ids_.size());
    sample_ids_.push_back(sample_id);
    sample_rows_.emplace(sample_id, row);
    rows_.emplace_back();
    rows_.back().fill(0);
    return row;
}

int MatrixBuilder::add_sample(const std::string& sample_id, const std::array<int64_t, kNumMotifClasses>& counts) {
    int row = row_for(sample_id);
    auto& dst = rows_[static_cast<size_t>(row)];
    for (int c = 0; c < kNumMotifClasses; ++c) {
        dst[c] += counts[c];
    }
    return row;
}

void MatrixBuilder::add_count(const std::string& sample_id, const std::string& motif, int64_t n) {
    const int col = SubstitutionClassifier::motif_index(motif);
    if (col < 0) {
        throw std::invalid_argument("MatrixBuilder: unknown trinucleotide class '" + motif + "'");
    }
    int row = row_for(sample_id);
    rows_[static_cast<size_t>(row)][col] += n;
}

void MatrixBuilder::add_aggregates(const std::map<std::string, SampleAggregate>& samples) {
    for (const auto& kv : samples) {
        add_sample(kv.first, kv.second.type_motif_counts);
    }
}

void MatrixBuilder::finalize() {
    if (finalized_) {
        return;  // Already finalized
    }

    const auto& motifs = SubstitutionClassifier::canonical_motifs();
    matrix_.sample_ids = sample_ids_;
    matrix_.motifs.assign(motifs.begin(), motifs.end());

    // Unobserved cells are zero
    matrix_.counts = CountMatrix::Zero(static_cast<Eigen::Index>(rows_.size()), kNumMotifClasses);
    for (size_t r = 0; r < rows_.size(); ++r) {
        for (int c = 0; c < kNumMotifClasses; ++c) {
            matrix_.counts(static_cast<Eigen::Index>(r), c) = rows_[r][c];
        }
    }

    rows_.clear();
    finalized_ = true;

    LOG_INFO("Matrix of dimension " + std::to_string(matrix_.counts.rows()) + "x" +
             std::to_string(matrix_.counts.cols()));
}

const SignatureMatrix& MatrixBuilder::get_matrix() const {
    if (!finalized_) {
        throw std::runtime_error("MatrixBuilder::get_matrix: finalize() has not been called");
    }
    return matrix_;
}

void MatrixBuilder::clear() {
    sample_ids_.clear();
    sample_rows_.clear();
    rows_.clear();
    matrix_ = SignatureMatrix();
    finalized_ = false;
}

}  // namespace TrinucMatrix
