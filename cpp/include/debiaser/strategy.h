#pragma once
#include "debiaser/types.h"

namespace debiaser {

// In-place bias removal from a (scaled) matrix.
class DebiasStrategy {
public:
    virtual ~DebiasStrategy() = default;

    virtual void debias(Matrix& mat) = 0;

    // true → rows must be covariate-sorted before debias() and unsorted after.
    virtual bool requires_sort() const = 0;

    virtual DebiasMethod method() const = 0;
};

} // namespace debiaser
