#include "correlation.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

#include <boost/math/distributions/normal.hpp>

namespace riskcalc {

// ============================================================================
// CorrelationMatrix Implementation
// ============================================================================

CorrelationMatrix::CorrelationMatrix(const std::vector<CorrelationEntry>& entries) {
    for (const auto& entry : entries) {
        add(entry);
        if (!contains_id(entry.risk_a)) {
            risk_ids_.push_back(entry.risk_a);
        }
        if (!contains_id(entry.risk_b)) {
            risk_ids_.push_back(entry.risk_b);
        }
    }
}

CorrelationMatrix::CorrelationMatrix(std::vector<std::string> risk_ids,
                                     const std::vector<CorrelationEntry>& entries)
    : risk_ids_(std::move(risk_ids))
{
    for (const auto& entry : entries) {
        if (!contains_id(entry.risk_a) || !contains_id(entry.risk_b)) {
            throw ValidationError("Correlation pair (" + entry.risk_a + ", " + entry.risk_b +
                                  ") names a risk outside the participating list");
        }
        add(entry);
    }
}

CorrelationMatrix::Key CorrelationMatrix::make_key(const std::string& a, const std::string& b) {
    return a < b ? Key(a, b) : Key(b, a);
}

bool CorrelationMatrix::contains_id(const std::string& id) const {
    return std::find(risk_ids_.begin(), risk_ids_.end(), id) != risk_ids_.end();
}

void CorrelationMatrix::add(const CorrelationEntry& entry) {
    if (entry.risk_a.empty() || entry.risk_b.empty()) {
        throw ValidationError("Correlation pair ids must not be empty");
    }
    if (!(entry.coefficient >= -1.0 && entry.coefficient <= 1.0)) {
        std::ostringstream oss;
        oss << "Correlation coefficient for (" << entry.risk_a << ", " << entry.risk_b
            << ") must lie in [-1, 1], got " << entry.coefficient;
        throw ValidationError(oss.str());
    }

    if (entry.risk_a == entry.risk_b) {
        if (entry.coefficient != 1.0) {
            throw ValidationError("Self-correlation of '" + entry.risk_a + "' must be 1.0");
        }
        return;
    }

    Key key = make_key(entry.risk_a, entry.risk_b);
    auto it = coefficients_.find(key);
    if (it != coefficients_.end()) {
        if (it->second != entry.coefficient) {
            throw ValidationError("Conflicting coefficients supplied for pair (" +
                                  key.first + ", " + key.second + ")");
        }
        return;
    }
    coefficients_.emplace(std::move(key), entry.coefficient);
}

double CorrelationMatrix::coefficient(const std::string& a, const std::string& b) const {
    if (a == b) {
        return 1.0;
    }
    auto it = coefficients_.find(make_key(a, b));
    return it == coefficients_.end() ? 0.0 : it->second;
}

bool CorrelationMatrix::has_pair(const std::string& a, const std::string& b) const {
    return coefficients_.count(make_key(a, b)) > 0;
}

Eigen::MatrixXd CorrelationMatrix::to_dense(const std::vector<std::string>& ordered_ids) const {
    const Eigen::Index k = static_cast<Eigen::Index>(ordered_ids.size());
    Eigen::MatrixXd dense = Eigen::MatrixXd::Identity(k, k);
    for (Eigen::Index i = 0; i < k; ++i) {
        for (Eigen::Index j = i + 1; j < k; ++j) {
            double rho = coefficient(ordered_ids[static_cast<size_t>(i)], ordered_ids[static_cast<size_t>(j)]);
            dense(i, j) = rho;
            dense(j, i) = rho;
        }
    }
    return dense;
}

// ============================================================================
// PSD projection and factorization
// ============================================================================

Eigen::MatrixXd nearest_psd_correlation(const Eigen::MatrixXd& matrix) {
    if (matrix.rows() != matrix.cols()) {
        throw ValidationError("Correlation matrix must be square");
    }

    Eigen::MatrixXd symmetric = 0.5 * (matrix + matrix.transpose());
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(symmetric);
    if (solver.info() != Eigen::Success) {
        throw NumericalError("Eigen decomposition of correlation matrix failed");
    }

    Eigen::VectorXd eigenvalues = solver.eigenvalues().cwiseMax(PSD_EIGENVALUE_FLOOR);
    const Eigen::MatrixXd& vectors = solver.eigenvectors();
    Eigen::MatrixXd projected = vectors * eigenvalues.asDiagonal() * vectors.transpose();

    // Rescale to unit diagonal
    Eigen::VectorXd scale = projected.diagonal().cwiseSqrt().cwiseInverse();
    Eigen::MatrixXd result = scale.asDiagonal() * projected * scale.asDiagonal();
    result = 0.5 * (result + result.transpose());
    result.diagonal().setOnes();
    return result;
}

CholeskyFactor factor_correlation(const Eigen::MatrixXd& matrix) {
    CholeskyFactor factor;
    factor.adjusted = false;

    Eigen::LLT<Eigen::MatrixXd> llt(matrix);
    if (llt.info() == Eigen::Success) {
        factor.lower = llt.matrixL();
        return factor;
    }

    Eigen::MatrixXd projected = nearest_psd_correlation(matrix);
    Eigen::LLT<Eigen::MatrixXd> projected_llt(projected);
    if (projected_llt.info() != Eigen::Success) {
        throw NumericalError("Correlation matrix could not be factored after PSD projection");
    }
    factor.lower = projected_llt.matrixL();
    factor.adjusted = true;
    return factor;
}

// ============================================================================
// CorrelatedSampler Implementation
// ============================================================================

CorrelatedSampler::CorrelatedSampler(std::vector<ProbabilityDistribution> marginals,
                                     const Eigen::MatrixXd& correlation)
    : marginals_(std::move(marginals)), adjusted_(false)
{
    const Eigen::Index k = static_cast<Eigen::Index>(marginals_.size());
    if (correlation.rows() != k || correlation.cols() != k) {
        throw ValidationError("Correlation matrix dimension does not match the number of marginals");
    }
    CholeskyFactor factor = factor_correlation(correlation);
    lower_ = std::move(factor.lower);
    adjusted_ = factor.adjusted;
}

void CorrelatedSampler::draw(std::mt19937_64& rng, std::vector<double>& out) const {
    static const boost::math::normal_distribution<double> standard_normal(0.0, 1.0);
    std::normal_distribution<double> normal(0.0, 1.0);

    const Eigen::Index k = lower_.rows();
    Eigen::VectorXd z(k);
    for (Eigen::Index i = 0; i < k; ++i) {
        z(i) = normal(rng);
    }
    Eigen::VectorXd correlated = lower_.triangularView<Eigen::Lower>() * z;

    out.resize(marginals_.size());
    for (size_t i = 0; i < marginals_.size(); ++i) {
        double u = boost::math::cdf(standard_normal, correlated(static_cast<Eigen::Index>(i)));
        out[i] = marginals_[i].quantile(u);
    }
}

std::vector<std::vector<double>> CorrelatedSampler::sample(std::mt19937_64& rng, size_t count) const {
    std::vector<std::vector<double>> columns(marginals_.size());
    for (auto& column : columns) {
        column.reserve(count);
    }

    std::vector<double> row;
    for (size_t n = 0; n < count; ++n) {
        draw(rng, row);
        for (size_t i = 0; i < row.size(); ++i) {
            columns[i].push_back(row[i]);
        }
    }
    return columns;
}

double sample_correlation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw ValidationError("Correlation requires samples of equal length");
    }
    if (x.size() < 2) {
        return 0.0;
    }

    double n = static_cast<double>(x.size());
    double mean_x = 0.0;
    double mean_y = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= n;
    mean_y /= n;

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - mean_x;
        double dy = y[i] - mean_y;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) {
        return 0.0;
    }
    return sxy / std::sqrt(sxx * syy);
}

} // namespace riskcalc
