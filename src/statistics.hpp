#ifndef RISKCALC_STATISTICS_HPP
#define RISKCALC_STATISTICS_HPP

#include <vector>

namespace riskcalc {
namespace stats {

// Arithmetic mean (0 for an empty sample)
double mean(const std::vector<double>& values);

// Sample variance / standard deviation with n - 1 in the denominator
// (0 for fewer than two values)
double variance(const std::vector<double>& values, double mean);
double std_dev(const std::vector<double>& values, double mean);

// Percentile using linear interpolation between order statistics.
// sorted_values must be ascending; p is in [0, 100].
double percentile(const std::vector<double>& sorted_values, double p);

// Sample skewness and excess kurtosis (0 when the sample has no spread)
double skewness(const std::vector<double>& values, double mean, double std_dev);
double excess_kurtosis(const std::vector<double>& values, double mean, double std_dev);

struct TestResult {
    double statistic;
    double p_value;  // two-sided
};

// Welch's unequal-variance t-test of mean(b) - mean(a).
// Both samples need at least two values.
TestResult welch_t_test(const std::vector<double>& a, const std::vector<double>& b);

// Welch-Satterthwaite degrees of freedom for the same comparison
double welch_degrees_of_freedom(const std::vector<double>& a, const std::vector<double>& b);

// Mann-Whitney U with tie-corrected normal approximation. statistic is U of a.
TestResult mann_whitney_u(const std::vector<double>& a, const std::vector<double>& b);

// Two-sample Kolmogorov-Smirnov with the asymptotic p-value. statistic is D.
TestResult kolmogorov_smirnov(const std::vector<double>& a, const std::vector<double>& b);

// Cohen's d of b relative to a using the pooled standard deviation
double cohens_d(const std::vector<double>& a, const std::vector<double>& b);

} // namespace stats
} // namespace riskcalc

#endif // RISKCALC_STATISTICS_HPP
