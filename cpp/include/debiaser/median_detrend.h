#pragma once
#include "debiaser/strategy.h"

namespace debiaser {

// Subtract a moving median from each column (sample).
//
// Rows are assumed covariate-sorted and already scaled. With
// mid = (window-1)/2 + 1:
//   rows [0, mid)        : window grows one value at a time, each row has the
//                          median of the values pushed so far subtracted
//   rows [mid, R-mid)    : push row i+mid, subtract the updated median from row i
//   rows [max(mid,R-mid), R): no further pushes, the last median is reused
class MovingMedianDebiaser final : public DebiasStrategy {
public:
    explicit MovingMedianDebiaser(int window);

    void debias(Matrix& mat) override;
    bool requires_sort() const override { return true; }
    DebiasMethod method() const override { return DebiasMethod::MovingMedian; }

    int window() const { return window_; }

    // Detrend a single column in place.
    static void detrend_column(double* col, int n, int window);

private:
    int window_;
};

} // namespace debiaser
