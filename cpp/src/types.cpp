#include "debiaser/types.h"
#include <stdexcept>

namespace debiaser {

DebiasMethod parse_debias_method(const std::string& s) {
    if (s == "moving_median" || s == "MovingMedian")       return DebiasMethod::MovingMedian;
    if (s == "chunk" || s == "chunk_ratio" || s == "ChunkRatio")
        return DebiasMethod::ChunkRatio;
    if (s == "svd" || s == "variance_truncation" || s == "VarianceTruncation")
        return DebiasMethod::VarianceTruncation;
    throw std::invalid_argument("Unknown debias method: " + s);
}

std::string to_string(DebiasMethod m) {
    switch (m) {
        case DebiasMethod::MovingMedian:       return "moving_median";
        case DebiasMethod::ChunkRatio:         return "chunk_ratio";
        case DebiasMethod::VarianceTruncation: return "variance_truncation";
    }
    return "unknown";
}

} // namespace debiaser
