#include "debiaser/sorter.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace debiaser {

CovariateSorter::CovariateSorter(Diagnostics diag) : diag_(std::move(diag)) {}

void CovariateSorter::set_covariate(Vector covariate) {
    covariate_ = std::move(covariate);
}

std::vector<int> CovariateSorter::argsort(const Vector& v) {
    std::vector<int> idx(static_cast<size_t>(v.size()));
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(),
                     [&](int a, int b) { return v[a] < v[b]; });
    return idx;
}

// ── sort ─────────────────────────────────────────────────────────────────────

void CovariateSorter::sort(Matrix& mat) {
    const Eigen::Index r = mat.rows();
    if (covariate_.size() != r) {
        throw std::invalid_argument(
            "covariate length (" + std::to_string(covariate_.size()) +
            ") must match matrix rows (" + std::to_string(r) + ")");
    }

    perm_ = argsort(covariate_);

    Matrix& tmp = tmp_.ensure(r, mat.cols());
    Vector cov(r);
    bool changed = false;
    for (Eigen::Index i = 0; i < r; ++i) {
        const int src = perm_[static_cast<size_t>(i)];
        if (src != i) changed = true;
        tmp.row(i) = mat.row(src);
        cov[i]     = covariate_[src];
    }
    if (!changed) {
        diag_.warn("no change after sorting. This usually means the covariate "
                   "is unset or the same as a previous run");
    }

    mat        = tmp;
    covariate_ = std::move(cov);
    sorted_    = true;
}

// ── unsort ───────────────────────────────────────────────────────────────────

void CovariateSorter::unsort(Matrix& mat) {
    if (!sorted_) throw std::runtime_error("unsort: must call sort first");

    const Eigen::Index r = mat.rows();
    if (static_cast<Eigen::Index>(perm_.size()) != r) {
        throw std::invalid_argument("unsort: matrix rows differ from the sorted matrix");
    }

    Matrix& tmp = tmp_.ensure(r, mat.cols());
    tmp = mat;
    Vector cov(r);
    for (Eigen::Index i = 0; i < r; ++i) {
        const int dst = perm_[static_cast<size_t>(i)];
        mat.row(dst) = tmp.row(i);
        cov[dst]     = covariate_[i];
    }

    covariate_ = std::move(cov);
    perm_.clear();
    sorted_ = false;
}

} // namespace debiaser
