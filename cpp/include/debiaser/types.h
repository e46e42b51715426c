#pragma once
#include <Eigen/Dense>
#include <optional>
#include <string>

namespace debiaser {

// rows = genomic positions / bins, cols = samples
using Matrix = Eigen::MatrixXd;
using Vector = Eigen::VectorXd;

// ── Enums ────────────────────────────────────────────────────────────────────

enum class DebiasMethod {
    MovingMedian,
    ChunkRatio,
    VarianceTruncation
};

enum class LogLevel {
    Info,
    Warn
};

// ── Configuration ─────────────────────────────────────────────────────────────

struct DebiasConfig {
    DebiasMethod method           = DebiasMethod::MovingMedian;
    int          window           = 0;     // moving-median span (rows), 0 = unset
    double       score_window     = 0.0;   // chunk span in covariate units, 0 = unset
    std::optional<double> min_variance_pct;  // percent of singular-value mass
    int          max_components   = 15;    // hard cap on removed components
};

DebiasMethod parse_debias_method(const std::string& s);
std::string  to_string(DebiasMethod m);

} // namespace debiaser
