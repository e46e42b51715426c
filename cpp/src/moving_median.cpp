#include "debiaser/moving_median.h"
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace debiaser {

MovingMedian::MovingMedian(int window) : window_(window) {
    if (window < 1) throw std::invalid_argument("MovingMedian window must be >= 1");
}

void MovingMedian::push(double x) {
    if (!std::isfinite(x)) throw std::invalid_argument("MovingMedian values must be finite");

    if (static_cast<int>(arrivals_.size()) == window_) {
        erase_value(arrivals_.front());
        arrivals_.pop_front();
    }
    arrivals_.push_back(x);

    // Eviction may have emptied either half, so check both bounds.
    if (!lower_.empty() && x <= *lower_.rbegin())       lower_.insert(x);
    else if (!upper_.empty() && x >= *upper_.begin())   upper_.insert(x);
    else                                                lower_.insert(x);
    rebalance();
}

double MovingMedian::median() const {
    if (lower_.empty()) return std::numeric_limits<double>::quiet_NaN();
    if (lower_.size() == upper_.size())
        return 0.5 * (*lower_.rbegin() + *upper_.begin());
    return *lower_.rbegin();
}

void MovingMedian::erase_value(double x) {
    // Equal values may straddle both halves; removing any copy is equivalent.
    auto it = lower_.find(x);
    if (it != lower_.end()) {
        lower_.erase(it);
        return;
    }
    it = upper_.find(x);
    if (it == upper_.end()) throw std::logic_error("MovingMedian: evicted value not in window");
    upper_.erase(it);
}

// Keep |lower_| == |upper_| or |lower_| == |upper_| + 1.
void MovingMedian::rebalance() {
    if (lower_.size() > upper_.size() + 1) {
        auto it = std::prev(lower_.end());
        upper_.insert(*it);
        lower_.erase(it);
    } else if (upper_.size() > lower_.size()) {
        auto it = upper_.begin();
        lower_.insert(*it);
        upper_.erase(it);
    }
}

} // namespace debiaser
