#pragma once
#include <stdexcept>
#include <vector>
#include "debiaser/strategy.h"
#include "debiaser/diagnostics.h"

namespace debiaser {

// Thrown when the singular value decomposition does not succeed.
class SvdError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Number of leading singular values whose share of the total singular-value
// mass (in percent) exceeds min_variance_pct. Scanning stops at the first
// value that fails the threshold, at max_components, or at the end of s.
int count_truncated_components(const Vector& s, double min_variance_pct,
                               int max_components = 15);

// Remove the dominant spectral components of the whole matrix:
// M = U S V^T  →  U S' V^T with the leading n entries of S' set to 0.
// Does not depend on row order.
class VarianceTruncationDebiaser final : public DebiasStrategy {
public:
    VarianceTruncationDebiaser(std::optional<double> min_variance_pct,
                               int max_components = 15,
                               Diagnostics diag = Diagnostics::spdlog_sink());

    void debias(Matrix& mat) override;
    bool requires_sort() const override { return false; }
    DebiasMethod method() const override { return DebiasMethod::VarianceTruncation; }

    // Variance shares (percent) of the components removed by the last debias().
    const std::vector<double>& last_removed() const { return last_removed_; }

private:
    std::optional<double> min_variance_pct_;
    int                   max_components_;
    Diagnostics           diag_;
    std::vector<double>   last_removed_;
};

} // namespace debiaser
