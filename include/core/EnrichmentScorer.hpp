#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/Aggregator.hpp"

namespace TrinucMatrix {

/// Samples with an enrichment ratio above this are labelled APOBEC enriched.
constexpr double kEnrichmentThreshold = 2.0;

/**
 * @brief 2x2 contingency table [[a, b], [c, d]].
 */
struct ContingencyTable {
    int64_t a = 0;
    int64_t b = 0;
    int64_t c = 0;
    int64_t d = 0;
};

/**
 * @brief Outcome of the one-sided exact test.
 *
 * odds_ratio is the conditional maximum-likelihood estimate; it is 0 when a
 * is at the lower end of its support and +inf at the upper end. ci_high is
 * always +inf for the "greater" alternative.
 */
struct ExactTestResult {
    double p_value = 1.0;
    double odds_ratio = 1.0;
    double ci_low = 0.0;
    double ci_high = 0.0;
};

/**
 * @brief One-sided (alternative = greater) Fisher exact test on a 2x2 table.
 *
 * Margins are held fixed; a follows a hypergeometric law under the null and a
 * Fisher noncentral hypergeometric law with the odds ratio as parameter
 * otherwise. p_value = P(X >= a). The confidence interval is
 * [ncp_low, +inf) where ncp_low solves P(X >= a; ncp_low) = 1 - confidence_level.
 *
 * @throws std::invalid_argument for negative cells or a confidence level outside (0, 1).
 */
ExactTestResult exact_enrichment_test(const ContingencyTable& table, double confidence_level = 0.95);

/**
 * @brief APOBEC enrichment of one sample.
 */
struct EnrichmentResult {
    std::string sample_id;
    SampleAggregate aggregate;
    double apobec_enrichment_ratio = 0.0;  ///< NaN when undefined
    ExactTestResult test;
    bool enriched = false;

    bool ratio_defined() const;
};

/**
 * @brief Contingency table used for a sample:
 *
 *   [ tCw/wGa mutations,  APOBEC-type - tCw/wGa mutations ]
 *   [ bg C + bg tcw,      bg C - bg tcw                   ]
 */
ContingencyTable enrichment_table(const SampleAggregate& aggregate);

/**
 * @brief (tCw/wGa mutations / APOBEC-type mutations) / (bg tcw / bg C).
 *
 * NaN if there are no APOBEC-type mutations or no background C.
 */
double apobec_enrichment_ratio(const SampleAggregate& aggregate);

/**
 * @brief Scores every sample and orders the result by p-value.
 */
class EnrichmentScorer {
public:
    explicit EnrichmentScorer(double confidence_level = 0.95, int num_threads = 1);

    /**
     * @brief Computes ratio, exact test and label for each sample.
     *
     * Result is sorted ascending by p-value; NaN p-values sort last and ties
     * keep sample-id order.
     */
    std::vector<EnrichmentResult> score(const std::map<std::string, SampleAggregate>& samples) const;

private:
    double confidence_level_;
    int num_threads_;
};

}  // namespace TrinucMatrix
