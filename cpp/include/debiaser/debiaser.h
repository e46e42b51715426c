#pragma once
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include "debiaser/types.h"
#include "debiaser/diagnostics.h"
#include "debiaser/sorter.h"
#include "debiaser/strategy.h"

namespace debiaser {

// Sort → debias → unsort driver around one DebiasStrategy chosen by config.
//
// Usage: scale the matrix externally (e.g. z-score), set the covariate, then
// either call run(), or sort(), debias(), unsort() in that order.
//
// Not thread-safe: the permutation recorded by sort() is consumed by unsort(),
// so an instance must serve one matrix at a time.
class Debiaser {
public:
    explicit Debiaser(DebiasConfig cfg = DebiasConfig{},
                      Diagnostics diag = Diagnostics::spdlog_sink());

    Debiaser(const Debiaser&)            = delete;
    Debiaser& operator=(const Debiaser&) = delete;

    // ── Covariate ─────────────────────────────────────────────────────────────
    Debiaser& set_covariate(Vector covariate);
    const Vector& covariate() const { return sorter_.covariate(); }

    // ── Sortable ──────────────────────────────────────────────────────────────
    void sort(Matrix& mat)   { sorter_.sort(mat); }
    void unsort(Matrix& mat) { sorter_.unsort(mat); }

    // ── Debias ────────────────────────────────────────────────────────────────
    // Applies the strategy only; caller handles sort/unsort.
    void debias(Matrix& mat) { strategy_->debias(mat); }

    // Full pipeline; sorting is skipped for strategies that do not need it.
    void run(Matrix& mat);

    // ── Accessors ─────────────────────────────────────────────────────────────
    const DebiasConfig&    config()   const { return cfg_; }
    const CovariateSorter& sorter()   const { return sorter_; }
    DebiasStrategy&        strategy()       { return *strategy_; }
    bool                   requires_sort() const { return strategy_->requires_sort(); }

private:
    DebiasConfig                    cfg_;
    Diagnostics                     diag_;
    CovariateSorter                 sorter_;
    std::unique_ptr<DebiasStrategy> strategy_;
};

// Build the strategy named by cfg.method. Chunk-ratio reads its covariate
// from `sorter`, which must outlive the returned strategy.
std::unique_ptr<DebiasStrategy> make_strategy(const DebiasConfig& cfg,
                                              const CovariateSorter& sorter,
                                              Diagnostics diag);

} // namespace debiaser
