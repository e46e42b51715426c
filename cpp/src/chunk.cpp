#include "debiaser/chunk.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace debiaser {

static void check_score_window(double score_window) {
    if (!(score_window > 0.0) || !std::isfinite(score_window)) {
        throw std::invalid_argument("score_window must be set to a positive value");
    }
}

std::vector<int> chunk_bounds(const Vector& cov, double score_window) {
    check_score_window(score_window);
    const int n = static_cast<int>(cov.size());

    std::vector<int> bounds{0};
    if (n == 0) return bounds;

    double v0 = cov[0];
    for (int i = 0; i < n; ++i) {
        if (cov[i] - v0 > score_window) {
            v0 = cov[i];
            bounds.push_back(i);
        }
    }
    bounds.push_back(n);
    return bounds;
}

ChunkRatioDebiaser::ChunkRatioDebiaser(double score_window, const CovariateSorter& sorter)
    : score_window_(score_window), sorter_(sorter) {}

void ChunkRatioDebiaser::debias(Matrix& mat) {
    check_score_window(score_window_);

    const Vector& cov = sorter_.covariate();
    if (cov.size() != mat.rows()) {
        throw std::invalid_argument("covariate length must match matrix rows");
    }

    const std::vector<int> bounds = chunk_bounds(cov, score_window_);
    std::vector<double> work;
    work.reserve(static_cast<size_t>(mat.rows()));

    for (Eigen::Index s = 0; s < mat.cols(); ++s) {
        double* col = mat.col(s).data();
        for (size_t k = 1; k < bounds.size(); ++k) {
            const int si = bounds[k - 1];
            const int ei = bounds[k];
            work.assign(col + si, col + ei);
            const int m = (ei - si) / 2;
            std::nth_element(work.begin(), work.begin() + m, work.end());
            const double median = work[static_cast<size_t>(m)];
            for (int j = si; j < ei; ++j) col[j] /= median;
        }
    }
}

} // namespace debiaser
