#pragma once
#include <Eigen/Dense>

namespace debiaser {

// Owned, lazily (re)allocated work matrix. Reallocates only when the
// requested dimensions differ from the cached ones. Not shared between
// instances.
class ScratchBuffer {
public:
    Eigen::MatrixXd& ensure(Eigen::Index rows, Eigen::Index cols) {
        if (buf_.rows() != rows || buf_.cols() != cols) {
            buf_.resize(rows, cols);
            ++reallocations_;
        }
        return buf_;
    }

    bool matches(Eigen::Index rows, Eigen::Index cols) const {
        return buf_.rows() == rows && buf_.cols() == cols;
    }

    int reallocations() const { return reallocations_; }

private:
    Eigen::MatrixXd buf_;
    int reallocations_ = 0;
};

} // namespace debiaser
