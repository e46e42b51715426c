#pragma once
#include <vector>
#include "debiaser/strategy.h"
#include "debiaser/sorter.h"

namespace debiaser {

// Partition an ascending covariate into contiguous chunks.
// A new chunk starts at row i when covariate[i] - covariate[start] > score_window,
// where start is the first row of the current chunk.
// Returns boundaries [0, b1, ..., R]; chunk k is [bounds[k], bounds[k+1]).
std::vector<int> chunk_bounds(const Vector& sorted_covariate, double score_window);

// Divide each chunk of each column by that chunk's median (element at index
// (end-start)/2 of the sorted chunk, i.e. the upper-middle element for even sizes).
// The index rule is what is kept for even sizes, even though it is often called
// the "lower median"; the two middle values are never averaged.
// Reads the (sorted) covariate from the sorter it shares with the caller.
class ChunkRatioDebiaser final : public DebiasStrategy {
public:
    ChunkRatioDebiaser(double score_window, const CovariateSorter& sorter);

    void debias(Matrix& mat) override;
    bool requires_sort() const override { return true; }
    DebiasMethod method() const override { return DebiasMethod::ChunkRatio; }

    double score_window() const { return score_window_; }

private:
    double score_window_;
    const CovariateSorter& sorter_;
};

} // namespace debiaser
