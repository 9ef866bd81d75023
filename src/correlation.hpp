#ifndef RISKCALC_CORRELATION_HPP
#define RISKCALC_CORRELATION_HPP

#include "distribution.hpp"
#include <Eigen/Dense>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace riskcalc {

// Eigenvalue floor used when projecting onto the PSD cone
constexpr double PSD_EIGENVALUE_FLOOR = 1e-8;

struct CorrelationEntry {
    std::string risk_a;
    std::string risk_b;
    double coefficient;
};

// Sparse symmetric correlation over risk ids. Pairs not present are
// uncorrelated; the diagonal is implicitly 1.
class CorrelationMatrix {
public:
    using Key = std::pair<std::string, std::string>;

    CorrelationMatrix() = default;

    // Participating ids are derived from the entries
    explicit CorrelationMatrix(const std::vector<CorrelationEntry>& entries);

    // Every id named by an entry must appear in risk_ids
    CorrelationMatrix(std::vector<std::string> risk_ids, const std::vector<CorrelationEntry>& entries);

    // Coefficient of (a, b) in either order; 1 on the diagonal, 0 if unset
    double coefficient(const std::string& a, const std::string& b) const;
    bool has_pair(const std::string& a, const std::string& b) const;

    const std::vector<std::string>& risk_ids() const { return risk_ids_; }
    const std::map<Key, double>& coefficients() const { return coefficients_; }
    bool empty() const { return coefficients_.empty(); }
    size_t size() const { return coefficients_.size(); }

    // Dense K x K matrix in the order of ordered_ids (identity elsewhere)
    Eigen::MatrixXd to_dense(const std::vector<std::string>& ordered_ids) const;

private:
    std::vector<std::string> risk_ids_;
    std::map<Key, double> coefficients_;  // key.first < key.second

    void add(const CorrelationEntry& entry);
    bool contains_id(const std::string& id) const;
    static Key make_key(const std::string& a, const std::string& b);
};

// Nearest positive semi-definite correlation matrix: symmetric eigen
// decomposition, eigenvalues clipped to PSD_EIGENVALUE_FLOOR, rescaled back
// to unit diagonal. Deterministic for a given input.
Eigen::MatrixXd nearest_psd_correlation(const Eigen::MatrixXd& matrix);

struct CholeskyFactor {
    Eigen::MatrixXd lower;
    bool adjusted;  // true if the input had to be projected first
};

// Lower Cholesky factor of a correlation matrix, projecting it onto the PSD
// cone when the direct factorization fails. Throws NumericalError if the
// projected matrix still cannot be factored.
CholeskyFactor factor_correlation(const Eigen::MatrixXd& matrix);

// Draws one correlated vector per call: correlated standard normals are
// mapped through the normal CDF and each marginal's quantile function.
class CorrelatedSampler {
public:
    CorrelatedSampler(std::vector<ProbabilityDistribution> marginals, const Eigen::MatrixXd& correlation);

    size_t dimension() const { return marginals_.size(); }
    bool adjusted() const { return adjusted_; }
    const Eigen::MatrixXd& cholesky_lower() const { return lower_; }

    // Fills out (resized to dimension()) with one joint draw
    void draw(std::mt19937_64& rng, std::vector<double>& out) const;

    // count joint draws, returned as one vector per marginal
    std::vector<std::vector<double>> sample(std::mt19937_64& rng, size_t count) const;

private:
    std::vector<ProbabilityDistribution> marginals_;
    Eigen::MatrixXd lower_;
    bool adjusted_;
};

// Pearson correlation of two equally sized samples (0 if either is constant)
double sample_correlation(const std::vector<double>& x, const std::vector<double>& y);

} // namespace riskcalc

#endif // RISKCALC_CORRELATION_HPP
