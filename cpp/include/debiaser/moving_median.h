#pragma once
#include <deque>
#include <set>

namespace debiaser {

// Sliding-window median over the most recent `window` pushed values.
// Two ordered halves (lower / upper) plus an arrival queue for eviction;
// push and median are O(log window).
class MovingMedian {
public:
    explicit MovingMedian(int window);

    // push: append x, evicting the oldest value once the window is full.
    // Throws std::invalid_argument for NaN or infinite x.
    void push(double x);

    // median: middle value of the current contents; mean of the two middle
    // values for an even count. NaN when nothing has been pushed.
    double median() const;

    int window() const { return window_; }
    int size()   const { return static_cast<int>(arrivals_.size()); }

private:
    void erase_value(double x);
    void rebalance();

    int window_;
    std::deque<double>    arrivals_;
    std::multiset<double> lower_;   // max(lower_) <= min(upper_)
    std::multiset<double> upper_;
};

} // namespace debiaser
