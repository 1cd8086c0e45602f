#pragma once

/// @file dominance.hpp
/// @brief Pareto dominance relations, plain and constraint-aware
///
/// All objectives are minimized. Both relations are irreflexive and asymmetric; the
/// constrained relation is not transitive in general when violations tie, which is why the
/// sorters count pairwise dominations instead of assuming a total order.

#include <algorithm>
#include <cstddef>
#include <span>

#include <paretolab/core/concepts.hpp>
#include <paretolab/utils/compiler_hints.hpp>

namespace paretolab::core {

/// True iff `a` is no worse than `b` on every objective and strictly better on one
///
/// @pre a.size() == b.size()
[[nodiscard]] PARETOLAB_FORCE_INLINE bool dominates(std::span<const double> a,
                                                std::span<const double> b) noexcept {
    bool strictly_better = false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] > b[i]) {
            return false;
        }
        if (a[i] < b[i]) {
            strictly_better = true;
        }
    }
    return strictly_better;
}

[[nodiscard]] inline bool dominates(const FitnessRecord& a, const FitnessRecord& b) noexcept {
    return dominates(std::span<const double>(a.objectives), std::span<const double>(b.objectives));
}

/// Constraint-aware dominance
///
/// | a feasible | b feasible | result                                   |
/// |------------|------------|------------------------------------------|
/// | yes        | no         | true                                     |
/// | no         | yes        | false                                    |
/// | no         | no         | a has the strictly lower total violation |
/// | yes        | yes        | plain dominance on objectives            |
[[nodiscard]] inline bool dominates_constrained(const FitnessRecord& a,
                                                const FitnessRecord& b) noexcept {
    const double va = a.total_violation();
    const double vb = b.total_violation();
    const bool a_feasible = va == 0.0;
    const bool b_feasible = vb == 0.0;

    if (a_feasible && b_feasible) {
        return dominates(a, b);
    }
    if (a_feasible != b_feasible) {
        return a_feasible;
    }
    return va < vb;
}

/// Plain Pareto dominance on objectives
struct ParetoDominance {
    [[nodiscard]] bool dominates(const FitnessRecord& a, const FitnessRecord& b) const noexcept {
        return core::dominates(a, b);
    }

    [[nodiscard]] bool equivalent(const FitnessRecord& a, const FitnessRecord& b) const noexcept {
        return a.objectives == b.objectives;
    }

    /// Lexicographic order on objectives
    [[nodiscard]] bool order(const FitnessRecord& a, const FitnessRecord& b) const noexcept {
        return std::ranges::lexicographical_compare(a.objectives, b.objectives);
    }
};

/// Constraint-aware dominance; records are told apart by objectives and total violation
struct ConstrainedDominance {
    [[nodiscard]] bool dominates(const FitnessRecord& a, const FitnessRecord& b) const noexcept {
        return core::dominates_constrained(a, b);
    }

    [[nodiscard]] bool equivalent(const FitnessRecord& a, const FitnessRecord& b) const noexcept {
        return a.objectives == b.objectives && a.total_violation() == b.total_violation();
    }

    [[nodiscard]] bool order(const FitnessRecord& a, const FitnessRecord& b) const noexcept {
        const double va = a.total_violation();
        const double vb = b.total_violation();
        if (va != vb) {
            return va < vb;
        }
        return std::ranges::lexicographical_compare(a.objectives, b.objectives);
    }
};

static_assert(DominanceRelation<ParetoDominance>);
static_assert(DominanceRelation<ConstrainedDominance>);

} // namespace paretolab::core
