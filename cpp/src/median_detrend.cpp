#include "debiaser/median_detrend.h"
#include "debiaser/moving_median.h"
#include <stdexcept>
#include <string>

namespace debiaser {

MovingMedianDebiaser::MovingMedianDebiaser(int window) : window_(window) {}

void MovingMedianDebiaser::detrend_column(double* col, int n, int window) {
    MovingMedian mm(window);
    const int mid = (window - 1) / 2 + 1;

    // Warm-up: growing window.
    for (int i = 0; i < mid; ++i) {
        mm.push(col[i]);
        col[i] -= mm.median();
    }

    // Steady state: centred window.
    int i = mid;
    for (; i < n - mid; ++i) {
        mm.push(col[i + mid]);
        col[i] -= mm.median();
    }

    // Tail: window stops advancing.
    const double last = mm.median();
    for (; i < n; ++i) col[i] -= last;
}

void MovingMedianDebiaser::debias(Matrix& mat) {
    const int r = static_cast<int>(mat.rows());
    const int c = static_cast<int>(mat.cols());
    if (window_ < 1) {
        throw std::invalid_argument("moving-median window must be >= 1 (got " +
                                    std::to_string(window_) + ")");
    }
    if (window_ > r) {
        throw std::invalid_argument("moving-median window (" + std::to_string(window_) +
                                    ") exceeds number of rows (" + std::to_string(r) + ")");
    }

    // Column-major storage: each column is contiguous.
    for (int s = 0; s < c; ++s) {
        detrend_column(mat.col(s).data(), r, window_);
    }
}

} // namespace debiaser
