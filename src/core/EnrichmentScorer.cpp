#include "core/EnrichmentScorer.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <boost/math/distributions/hypergeometric.hpp>
#include <boost/math/special_functions/gamma.hpp>
#include <boost/math/tools/roots.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace TrinucMatrix {

namespace {

const double kInf = std::numeric_limits<double>::infinity();
const double kNaN = std::numeric_limits<double>::quiet_NaN();

double log_choose(int64_t n, int64_t k) {
    return boost::math::lgamma(static_cast<double>(n + 1)) - boost::math::lgamma(static_cast<double>(k + 1)) -
           boost::math::lgamma(static_cast<double>(n - k + 1));
}

/**
 * @brief Fisher's noncentral hypergeometric law of the top-left cell.
 *
 * m = first column total, n = second column total, k = first row total.
 * Support is [max(0, k - n), min(k, m)].
 */
class NoncentralHypergeometric {
public:
    NoncentralHypergeometric(int64_t m, int64_t n, int64_t k)
        : lo_(std::max<int64_t>(0, k - n)), hi_(std::min(k, m)) {
        const double log_total = log_choose(m + n, k);
        log_dc_.reserve(static_cast<size_t>(hi_ - lo_ + 1));
        for (int64_t x = lo_; x <= hi_; ++x) {
            log_dc_.push_back(log_choose(m, x) + log_choose(n, k - x) - log_total);
        }
    }

    int64_t lo() const { return lo_; }
    int64_t hi() const { return hi_; }

    // Normalized density over the support for a finite, positive ncp
    std::vector<double> density(double ncp) const {
        std::vector<double> d(log_dc_.size());
        const double log_ncp = std::log(ncp);
        double max_d = -kInf;
        for (size_t i = 0; i < d.size(); ++i) {
            d[i] = log_dc_[i] + log_ncp * static_cast<double>(lo_ + static_cast<int64_t>(i));
            max_d = std::max(max_d, d[i]);
        }
        double sum = 0.0;
        for (auto& v : d) {
            v = std::exp(v - max_d);
            sum += v;
        }
        for (auto& v : d) {
            v /= sum;
        }
        return d;
    }

    double mean(double ncp) const {
        if (ncp == 0.0) return static_cast<double>(lo_);
        if (std::isinf(ncp)) return static_cast<double>(hi_);

        const std::vector<double> d = density(ncp);
        double mu = 0.0;
        for (size_t i = 0; i < d.size(); ++i) {
            mu += static_cast<double>(lo_ + static_cast<int64_t>(i)) * d[i];
        }
        return mu;
    }

    // P(X >= q)
    double upper_tail(int64_t q, double ncp) const {
        if (ncp == 0.0) return q <= lo_ ? 1.0 : 0.0;
        if (std::isinf(ncp)) return q <= hi_ ? 1.0 : 0.0;

        const std::vector<double> d = density(ncp);
        double p = 0.0;
        for (size_t i = 0; i < d.size(); ++i) {
            if (lo_ + static_cast<int64_t>(i) >= q) {
                p += d[i];
            }
        }
        return p;
    }

private:
    int64_t lo_;
    int64_t hi_;
    std::vector<double> log_dc_;
};

template <class F>
double solve_unit_interval(F f, double lower, double upper) {
    std::uintmax_t max_iter = 200;
    boost::math::tools::eps_tolerance<double> tol(40);
    std::pair<double, double> r = boost::math::tools::toms748_solve(f, lower, upper, tol, max_iter);
    return (r.first + r.second) / 2.0;
}

// Conditional maximum-likelihood estimate of the odds ratio
double conditional_mle(const NoncentralHypergeometric& dist, int64_t x) {
    if (x == dist.lo()) return 0.0;
    if (x == dist.hi()) return kInf;

    const double xd = static_cast<double>(x);
    const double mu = dist.mean(1.0);
    if (mu > xd) {
        return solve_unit_interval([&](double t) { return dist.mean(t) - xd; }, 0.0, 1.0);
    }
    if (mu < xd) {
        const double inv = solve_unit_interval([&](double t) { return dist.mean(1.0 / t) - xd; },
                                               std::numeric_limits<double>::epsilon(), 1.0);
        return 1.0 / inv;
    }
    return 1.0;
}

// Lower confidence bound for the "greater" alternative
double ncp_lower(const NoncentralHypergeometric& dist, int64_t x, double alpha) {
    if (x == dist.lo()) return 0.0;

    const double p = dist.upper_tail(x, 1.0);
    if (p > alpha) {
        return solve_unit_interval([&](double t) { return dist.upper_tail(x, t) - alpha; }, 0.0, 1.0);
    }
    if (p < alpha) {
        const double inv = solve_unit_interval([&](double t) { return dist.upper_tail(x, 1.0 / t) - alpha; },
                                               std::numeric_limits<double>::epsilon(), 1.0);
        return 1.0 / inv;
    }
    return 1.0;
}

}  // namespace

ExactTestResult exact_enrichment_test(const ContingencyTable& table, double confidence_level) {
    if (table.a < 0 || table.b < 0 || table.c < 0 || table.d < 0) {
        throw std::invalid_argument("Contingency table cells must be non-negative");
    }
    if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
        throw std::invalid_argument("Confidence level must lie in (0, 1)");
    }

    const int64_t m = table.a + table.c;  // first column
    const int64_t n = table.b + table.d;  // second column
    const int64_t k = table.a + table.b;  // first row
    const int64_t x = table.a;

    NoncentralHypergeometric dist(m, n, k);

    ExactTestResult result;
    result.ci_high = kInf;

    if (x == dist.lo()) {
        result.p_value = 1.0;
    } else {
        // r defective items among N, sample of size k
        boost::math::hypergeometric_distribution<double> hgd(static_cast<unsigned>(m), static_cast<unsigned>(k),
                                                             static_cast<unsigned>(m + n));
        result.p_value = boost::math::cdf(boost::math::complement(hgd, static_cast<unsigned>(x - 1)));
    }

    result.odds_ratio = conditional_mle(dist, x);
    result.ci_low = ncp_lower(dist, x, 1.0 - confidence_level);
    return result;
}

bool EnrichmentResult::ratio_defined() const {
    return !std::isnan(apobec_enrichment_ratio);
}

ContingencyTable enrichment_table(const SampleAggregate& aggregate) {
    ContingencyTable t;
    t.a = aggregate.tcw_wga_mutations();
    t.b = aggregate.apobec_mutations() - aggregate.tcw_wga_mutations();
    t.c = aggregate.bg_c + aggregate.bg_tcw;
    t.d = aggregate.bg_c - aggregate.bg_tcw;
    return t;
}

double apobec_enrichment_ratio(const SampleAggregate& aggregate) {
    const int64_t apobec = aggregate.apobec_mutations();
    if (apobec == 0 || aggregate.bg_c == 0) {
        return kNaN;
    }
    const double mutation_fraction =
        static_cast<double>(aggregate.tcw_wga_mutations()) / static_cast<double>(apobec);
    const double background_fraction = static_cast<double>(aggregate.bg_tcw) / static_cast<double>(aggregate.bg_c);
    return mutation_fraction / background_fraction;
}

EnrichmentScorer::EnrichmentScorer(double confidence_level, int num_threads)
    : confidence_level_(confidence_level), num_threads_(std::max(1, num_threads)) {
}

std::vector<EnrichmentResult> EnrichmentScorer::score(const std::map<std::string, SampleAggregate>& samples) const {
    std::vector<const SampleAggregate*> ordered;
    ordered.reserve(samples.size());
    for (const auto& kv : samples) {
        ordered.push_back(&kv.second);
    }

    const int64_t n = static_cast<int64_t>(ordered.size());
    std::vector<EnrichmentResult> results(ordered.size());
    std::vector<std::exception_ptr> errors(ordered.size());

#pragma omp parallel for schedule(dynamic) num_threads(num_threads_)
    for (int64_t i = 0; i < n; ++i) {
        try {
            const SampleAggregate& agg = *ordered[static_cast<size_t>(i)];
            EnrichmentResult& r = results[static_cast<size_t>(i)];
            r.sample_id = agg.sample_id;
            r.aggregate = agg;
            r.apobec_enrichment_ratio = apobec_enrichment_ratio(agg);
            r.test = exact_enrichment_test(enrichment_table(agg), confidence_level_);
            r.enriched = r.apobec_enrichment_ratio > kEnrichmentThreshold;
        } catch (...) {
            errors[static_cast<size_t>(i)] = std::current_exception();
        }
    }

    for (const auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const EnrichmentResult& lhs, const EnrichmentResult& rhs) {
        const bool lhs_nan = std::isnan(lhs.test.p_value);
        const bool rhs_nan = std::isnan(rhs.test.p_value);
        if (lhs_nan != rhs_nan) {
            return rhs_nan;
        }
        return !lhs_nan && lhs.test.p_value < rhs.test.p_value;
    });

    size_t n_enriched = 0;
    size_t n_undefined = 0;
    for (const auto& r : results) {
        if (r.enriched) n_enriched++;
        if (!r.ratio_defined()) n_undefined++;
    }

    if (!results.empty()) {
        std::stringstream ss;
        ss << "APOBEC related mutations are enriched in " << std::fixed << std::setprecision(3)
           << (100.0 * static_cast<double>(n_enriched) / static_cast<double>(results.size()))
           << "% of samples (APOBEC enrichment score > " << kEnrichmentThreshold << "; " << n_enriched << " of "
           << results.size() << " samples)";
        LOG_INFO(ss.str());
    }
    if (n_undefined > 0) {
        LOG_WARNING(std::to_string(n_undefined) +
                    " samples have an undefined enrichment ratio (no APOBEC-type mutations or no background C)");
    }

    return results;
}

}  // namespace TrinucMatrix
