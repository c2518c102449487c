#pragma once

#include <Eigen/Dense>

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/Aggregator.hpp"
#include "core/SubstitutionClassifier.hpp"

namespace TrinucMatrix {

/// Sample x 96 integer count matrix.
using CountMatrix = Eigen::Matrix<int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Final sample x class matrix with its row and column labels.
 */
struct SignatureMatrix {
    std::vector<std::string> sample_ids;  ///< Row labels
    std::vector<std::string> motifs;      ///< Column labels (canonical order, always 96)
    CountMatrix counts;

    int num_samples() const { return static_cast<int>(sample_ids.size()); }
    int num_classes() const { return static_cast<int>(motifs.size()); }

    /**
     * @brief Row index of a sample, or -1.
     */
    int row_of(const std::string& sample_id) const;
};

/**
 * @brief Builds the sample x 96-class count matrix.
 *
 * Per-sample counts are collected with add_sample()/add_count(); finalize()
 * pivots them into a dense matrix in canonical column order. Classes never
 * observed become zero columns, so the matrix has no missing values.
 */
class MatrixBuilder {
public:
    MatrixBuilder() = default;

    /**
     * @brief Adds one sample's 96-class counts (canonical order).
     * @return Row index of the sample.
     */
    int add_sample(const std::string& sample_id, const std::array<int64_t, kNumMotifClasses>& counts);

    /**
     * @brief Adds n observations of one class to a sample (created if new).
     * @throws std::invalid_argument if motif is not one of the 96 classes.
     */
    void add_count(const std::string& sample_id, const std::string& motif, int64_t n = 1);

    /**
     * @brief Adds every aggregate in sample-id order.
     */
    void add_aggregates(const std::map<std::string, SampleAggregate>& samples);

    /**
     * @brief Allocates and fills the dense matrix. Idempotent.
     */
    void finalize();

    /**
     * @brief The finished matrix.
     * @throws std::runtime_error if finalize() has not been called.
     */
    const SignatureMatrix& get_matrix() const;

    int num_samples() const { return static_cast<int>(sample_ids_.size()); }

    void clear();

private:
    int row_for(const std::string& sample_id);

    std::vector<std::string> sample_ids_;
    std::map<std::string, int> sample_rows_;
    std::vector<std::array<int64_t, kNumMotifClasses>> rows_;

    SignatureMatrix matrix_;
    bool finalized_ = false;
};

}  // namespace TrinucMatrix
