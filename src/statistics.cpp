#include "statistics.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>
#include <utility>

#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

namespace riskcalc {
namespace stats {

namespace {

void require_two_samples(const std::vector<double>& a, const std::vector<double>& b,
                         const char* test_name) {
    if (a.size() < 2 || b.size() < 2) {
        throw ValidationError(std::string(test_name) + " requires at least two values per sample");
    }
}

// Kolmogorov distribution survival function Q(lambda)
double kolmogorov_survival(double lambda) {
    if (lambda < 1e-3) {
        return 1.0;
    }
    double sum = 0.0;
    double sign = 1.0;
    for (int k = 1; k <= 100; ++k) {
        double term = sign * std::exp(-2.0 * k * k * lambda * lambda);
        sum += term;
        if (std::fabs(term) < 1e-12) {
            break;
        }
        sign = -sign;
    }
    return std::min(1.0, std::max(0.0, 2.0 * sum));
}

} // anonymous namespace

// ============================================================================
// Descriptive statistics
// ============================================================================

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double variance(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return sum_sq_diff / static_cast<double>(values.size() - 1);
}

double std_dev(const std::vector<double>& values, double mean) {
    return std::sqrt(variance(values, mean));
}

double percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[std::min(lower_idx, sorted_values.size() - 1)];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

double skewness(const std::vector<double>& values, double mean, double std_dev) {
    if (values.size() < 3 || std_dev <= 0.0) {
        return 0.0;
    }
    double sum = 0.0;
    for (double v : values) {
        double z = (v - mean) / std_dev;
        sum += z * z * z;
    }
    return sum / static_cast<double>(values.size());
}

double excess_kurtosis(const std::vector<double>& values, double mean, double std_dev) {
    if (values.size() < 4 || std_dev <= 0.0) {
        return 0.0;
    }
    double sum = 0.0;
    for (double v : values) {
        double z = (v - mean) / std_dev;
        sum += z * z * z * z;
    }
    return sum / static_cast<double>(values.size()) - 3.0;
}

// ============================================================================
// Two-sample tests
// ============================================================================

double welch_degrees_of_freedom(const std::vector<double>& a, const std::vector<double>& b) {
    require_two_samples(a, b, "Welch t-test");
    double na = static_cast<double>(a.size());
    double nb = static_cast<double>(b.size());
    double va = variance(a, mean(a)) / na;
    double vb = variance(b, mean(b)) / nb;
    double denom = va * va / (na - 1.0) + vb * vb / (nb - 1.0);
    if (denom <= 0.0) {
        return na + nb - 2.0;
    }
    return (va + vb) * (va + vb) / denom;
}

TestResult welch_t_test(const std::vector<double>& a, const std::vector<double>& b) {
    require_two_samples(a, b, "Welch t-test");

    double mean_a = mean(a);
    double mean_b = mean(b);
    double se_sq = variance(a, mean_a) / static_cast<double>(a.size()) +
                   variance(b, mean_b) / static_cast<double>(b.size());

    TestResult result;
    if (se_sq <= 0.0) {
        // Both samples constant
        if (mean_a == mean_b) {
            result.statistic = 0.0;
            result.p_value = 1.0;
        } else {
            result.statistic = mean_b > mean_a ? std::numeric_limits<double>::infinity()
                                               : -std::numeric_limits<double>::infinity();
            result.p_value = 0.0;
        }
        return result;
    }

    result.statistic = (mean_b - mean_a) / std::sqrt(se_sq);
    boost::math::students_t_distribution<double> t_dist(welch_degrees_of_freedom(a, b));
    result.p_value = 2.0 * boost::math::cdf(boost::math::complement(t_dist, std::fabs(result.statistic)));
    result.p_value = std::min(1.0, result.p_value);
    return result;
}

TestResult mann_whitney_u(const std::vector<double>& a, const std::vector<double>& b) {
    require_two_samples(a, b, "Mann-Whitney U test");

    // (value, from_a) pooled and ranked with ties averaged
    std::vector<std::pair<double, bool>> pooled;
    pooled.reserve(a.size() + b.size());
    for (double v : a) pooled.emplace_back(v, true);
    for (double v : b) pooled.emplace_back(v, false);
    std::sort(pooled.begin(), pooled.end(),
              [](const std::pair<double, bool>& x, const std::pair<double, bool>& y) {
                  return x.first < y.first;
              });

    double rank_sum_a = 0.0;
    double tie_term = 0.0;
    size_t i = 0;
    while (i < pooled.size()) {
        size_t j = i;
        while (j + 1 < pooled.size() && pooled[j + 1].first == pooled[i].first) {
            ++j;
        }
        double avg_rank = 0.5 * static_cast<double>(i + j) + 1.0;
        double ties = static_cast<double>(j - i + 1);
        tie_term += ties * ties * ties - ties;
        for (size_t k = i; k <= j; ++k) {
            if (pooled[k].second) {
                rank_sum_a += avg_rank;
            }
        }
        i = j + 1;
    }

    double na = static_cast<double>(a.size());
    double nb = static_cast<double>(b.size());
    double n = na + nb;
    double u_a = rank_sum_a - na * (na + 1.0) / 2.0;
    double mu = na * nb / 2.0;
    double sigma_sq = na * nb / 12.0 * ((n + 1.0) - tie_term / (n * (n - 1.0)));

    TestResult result;
    result.statistic = u_a;
    // All values tied (up to rounding of the tie correction)
    if (sigma_sq <= 1e-12 * na * nb * (n + 1.0)) {
        result.p_value = 1.0;
        return result;
    }
    double z = (u_a - mu) / std::sqrt(sigma_sq);
    boost::math::normal_distribution<double> standard_normal(0.0, 1.0);
    result.p_value = std::min(1.0, 2.0 * boost::math::cdf(boost::math::complement(standard_normal, std::fabs(z))));
    return result;
}

TestResult kolmogorov_smirnov(const std::vector<double>& a, const std::vector<double>& b) {
    require_two_samples(a, b, "Kolmogorov-Smirnov test");

    std::vector<double> sa = a;
    std::vector<double> sb = b;
    std::sort(sa.begin(), sa.end());
    std::sort(sb.begin(), sb.end());

    double na = static_cast<double>(sa.size());
    double nb = static_cast<double>(sb.size());
    size_t i = 0;
    size_t j = 0;
    double d = 0.0;
    while (i < sa.size() && j < sb.size()) {
        double x = std::min(sa[i], sb[j]);
        while (i < sa.size() && sa[i] <= x) ++i;
        while (j < sb.size() && sb[j] <= x) ++j;
        d = std::max(d, std::fabs(static_cast<double>(i) / na - static_cast<double>(j) / nb));
    }

    double ne = na * nb / (na + nb);
    double sqrt_ne = std::sqrt(ne);
    double lambda = (sqrt_ne + 0.12 + 0.11 / sqrt_ne) * d;

    TestResult result;
    result.statistic = d;
    result.p_value = kolmogorov_survival(lambda);
    return result;
}

double cohens_d(const std::vector<double>& a, const std::vector<double>& b) {
    require_two_samples(a, b, "Cohen's d");
    double mean_a = mean(a);
    double mean_b = mean(b);
    double na = static_cast<double>(a.size());
    double nb = static_cast<double>(b.size());
    double pooled = std::sqrt(((na - 1.0) * variance(a, mean_a) + (nb - 1.0) * variance(b, mean_b)) /
                              (na + nb - 2.0));
    if (pooled <= 0.0) {
        return 0.0;
    }
    return (mean_b - mean_a) / pooled;
}

} // namespace stats
} // namespace riskcalc
