#include "debiaser/svd.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace debiaser {

int count_truncated_components(const Vector& s, double min_variance_pct,
                               int max_components) {
    const double sum = s.sum();
    if (!(sum > 0.0)) return 0;

    const int k = static_cast<int>(s.size());
    int n = 0;
    while (n < max_components && n < k && 100.0 * s[n] / sum > min_variance_pct) ++n;
    return n;
}

VarianceTruncationDebiaser::VarianceTruncationDebiaser(
    std::optional<double> min_variance_pct, int max_components, Diagnostics diag)
    : min_variance_pct_(min_variance_pct),
      max_components_(max_components),
      diag_(std::move(diag)) {}

void VarianceTruncationDebiaser::debias(Matrix& mat) {
    if (!min_variance_pct_ || !std::isfinite(*min_variance_pct_) || *min_variance_pct_ < 0.0) {
        throw std::invalid_argument("min_variance_pct must be set to a non-negative value");
    }
    if (max_components_ < 0) throw std::invalid_argument("max_components must be >= 0");

    last_removed_.clear();
    if (mat.size() == 0) return;

    Eigen::BDCSVD<Matrix> svd(mat, Eigen::ComputeThinU | Eigen::ComputeThinV);
    if (svd.info() != Eigen::Success || !svd.singularValues().allFinite()) {
        throw SvdError("error with SVD");
    }

    const Vector& s = svd.singularValues();
    const double sum = s.sum();
    const int n = count_truncated_components(s, *min_variance_pct_, max_components_);

    std::string report = "variance:";
    for (int i = 0; i < n; ++i) {
        const double pct = 100.0 * s[i] / sum;
        last_removed_.push_back(pct);
        report += fmt::format(" {:.2f}", pct);
    }
    diag_.info(report);

    // Leave the first n as 0 and keep the rest.
    Vector sigma = s;
    sigma.head(n).setZero();
    mat = svd.matrixU() * sigma.asDiagonal() * svd.matrixV().transpose();
}

} // namespace debiaser
