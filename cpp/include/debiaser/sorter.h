#pragma once
#include <Eigen/Dense>
#include <optional>
#include <vector>
#include "debiaser/types.h"
#include "debiaser/diagnostics.h"
#include "debiaser/scratch.h"

namespace debiaser {

// Reversible row permutation keyed on a per-row covariate (e.g. GC content).
//
// sort() reorders matrix rows and the covariate ascending by covariate value
// (stable: ties keep their original relative order) and remembers the
// permutation; unsort() puts both back and consumes the permutation.
//
// Holds state between sort() and unsort(): one instance must not be used on
// several matrices at once, nor from several threads without external locking.
class CovariateSorter {
public:
    explicit CovariateSorter(Diagnostics diag = Diagnostics::spdlog_sink());

    void set_covariate(Vector covariate);
    const Vector& covariate() const { return covariate_; }

    // sort: output row i = input row permutation[i].
    void sort(Matrix& mat);

    // unsort: output row permutation[i] = input row i.
    // Throws std::runtime_error if sort() has not been called.
    void unsort(Matrix& mat);

    // permutation[new position] = original position. Empty when not sorted.
    const std::vector<int>& permutation() const { return perm_; }
    bool sorted() const { return sorted_; }

    // Stable ascending argsort of v.
    static std::vector<int> argsort(const Vector& v);

    const ScratchBuffer& scratch() const { return tmp_; }

private:
    Diagnostics      diag_;
    Vector           covariate_;
    std::vector<int> perm_;
    bool             sorted_ = false;
    ScratchBuffer    tmp_;
};

} // namespace debiaser
