#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace paretolab::core {

/// Stable identifier of an individual, independent of its fitness values
using IndividualKey = std::uint64_t;

/// Ordered sequence of population positions sharing one dominance depth
using Front = std::vector<std::size_t>;

/// Raised when objective vectors of one call do not share a dimensionality
class DimensionMismatchError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/// Fitness record of one individual
///
/// Objectives are minimized. Constraint values are non-negative violations; an
/// individual is feasible when the violations sum to zero.
struct FitnessRecord {
    std::vector<double> objectives;
    std::vector<double> constraints;

    FitnessRecord() = default;
    explicit FitnessRecord(std::vector<double> objs) : objectives(std::move(objs)) {}
    FitnessRecord(std::vector<double> objs, std::vector<double> cons)
        : objectives(std::move(objs)), constraints(std::move(cons)) {}

    [[nodiscard]] std::size_t num_objectives() const noexcept { return objectives.size(); }

    /// Sum of the constraint-violation vector
    [[nodiscard]] double total_violation() const noexcept {
        return std::accumulate(constraints.begin(), constraints.end(), 0.0);
    }

    [[nodiscard]] bool feasible() const noexcept { return total_violation() == 0.0; }

    bool operator==(const FitnessRecord&) const = default;
};

/// Result of a non-dominated sort over population positions
struct SortResult {
    std::vector<Front> fronts;
    /// Set by constraint-aware sorts when no individual is feasible; the fronts are then
    /// the least-violating individual followed by everyone else by increasing violation
    bool all_infeasible = false;

    [[nodiscard]] std::size_t ranked() const noexcept {
        std::size_t count = 0;
        for (const auto& front : fronts) {
            count += front.size();
        }
        return count;
    }
};

/// Check that every record carries the same, non-zero number of objectives
///
/// @return The shared number of objectives M, or 0 for an empty span
/// @throws DimensionMismatchError on a zero-length or mismatched objective vector
inline std::size_t validate_dimensions(std::span<const FitnessRecord> fitnesses) {
    if (fitnesses.empty()) {
        return 0;
    }

    const std::size_t m = fitnesses.front().objectives.size();
    if (m == 0) {
        throw DimensionMismatchError("Fitness record 0 has no objective values");
    }

    for (std::size_t i = 1; i < fitnesses.size(); ++i) {
        if (fitnesses[i].objectives.size() != m) {
            throw DimensionMismatchError(
                "Fitness record " + std::to_string(i) + " has " +
                std::to_string(fitnesses[i].objectives.size()) + " objectives, expected " +
                std::to_string(m));
        }
    }
    return m;
}

/// Concept for pairwise dominance relations
///
/// A relation answers whether `a` dominates `b`, and provides the ordering and the
/// equivalence used to group records that the relation cannot tell apart.
template <typename R>
concept DominanceRelation =
    requires(const R& relation, const FitnessRecord& a, const FitnessRecord& b) {
        { relation.dominates(a, b) } -> std::same_as<bool>;
        { relation.equivalent(a, b) } -> std::same_as<bool>;
        { relation.order(a, b) } -> std::same_as<bool>;
    };

/// Concept for front-ranking algorithms
///
/// `rank` sorts by plain Pareto dominance, `rank_constrained` applies the
/// constraint-aware rule to populations holding at least one feasible individual.
/// Both return fronts over positions of the given span, covering at least
/// min(k, size) individuals.
template <typename S>
concept FrontSorter = requires(const S& sorter, std::span<const FitnessRecord> fitnesses,
                               std::size_t k) {
    { sorter.rank(fitnesses, k) } -> std::same_as<std::vector<Front>>;
    { sorter.rank_constrained(fitnesses, k) } -> std::same_as<std::vector<Front>>;
};

} // namespace paretolab::core
