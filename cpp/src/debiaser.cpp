#include "debiaser/debiaser.h"
#include "debiaser/median_detrend.h"
#include "debiaser/chunk.h"
#include "debiaser/svd.h"
#include <stdexcept>

namespace debiaser {

// ── Strategy factory ──────────────────────────────────────────────────────────

std::unique_ptr<DebiasStrategy> make_strategy(const DebiasConfig& cfg,
                                              const CovariateSorter& sorter,
                                              Diagnostics diag) {
    switch (cfg.method) {
        case DebiasMethod::MovingMedian:
            return std::make_unique<MovingMedianDebiaser>(cfg.window);
        case DebiasMethod::ChunkRatio:
            return std::make_unique<ChunkRatioDebiaser>(cfg.score_window, sorter);
        case DebiasMethod::VarianceTruncation:
            return std::make_unique<VarianceTruncationDebiaser>(
                cfg.min_variance_pct, cfg.max_components, std::move(diag));
    }
    throw std::invalid_argument("Unknown debias method");
}

// ── Constructor ───────────────────────────────────────────────────────────────

Debiaser::Debiaser(DebiasConfig cfg, Diagnostics diag)
    : cfg_(std::move(cfg)),
      diag_(std::move(diag)),
      sorter_(diag_),
      strategy_(make_strategy(cfg_, sorter_, diag_)) {}

Debiaser& Debiaser::set_covariate(Vector covariate) {
    if (sorter_.sorted()) {
        throw std::runtime_error("set_covariate: matrix is sorted, call unsort first");
    }
    sorter_.set_covariate(std::move(covariate));
    return *this;
}

// ── run ───────────────────────────────────────────────────────────────────────

void Debiaser::run(Matrix& mat) {
    if (!strategy_->requires_sort()) {
        strategy_->debias(mat);
        return;
    }
    sorter_.sort(mat);
    try {
        strategy_->debias(mat);
    } catch (...) {
        // restore row order before propagating
        sorter_.unsort(mat);
        throw;
    }
    sorter_.unsort(mat);
}

} // namespace debiaser
