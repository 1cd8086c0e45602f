#pragma once

/// @file nondominated_sort.hpp
/// @brief Runtime selection between the sorters, plain or constraint-aware

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <paretolab/core/concepts.hpp>
#include <paretolab/core/population.hpp>
#include <paretolab/sorting/fast_sort.hpp>
#include <paretolab/sorting/naive_sort.hpp>

namespace paretolab::sorting {

using core::SortResult;

enum class SortAlgorithm { naive, fast };

struct SortOptions {
    SortAlgorithm algorithm = SortAlgorithm::fast;
    bool constraint_aware = false;
};

[[nodiscard]] inline std::string_view to_string(SortAlgorithm algorithm) noexcept {
    return algorithm == SortAlgorithm::naive ? "naive" : "fast";
}

/// @throws std::invalid_argument for names other than "naive" and "fast"
[[nodiscard]] inline SortAlgorithm parse_sort_algorithm(std::string_view name) {
    if (name == "naive") {
        return SortAlgorithm::naive;
    }
    if (name == "fast") {
        return SortAlgorithm::fast;
    }
    throw std::invalid_argument("Unknown sort algorithm: " + std::string(name));
}

/// Sorter chosen at runtime
using AnySorter = std::variant<NaiveSort, FastSort>;

[[nodiscard]] inline AnySorter make_sorter(SortAlgorithm algorithm) {
    if (algorithm == SortAlgorithm::naive) {
        return NaiveSort{};
    }
    return FastSort{};
}

/// Sorter policy whose algorithm is picked at runtime, e.g. from configuration
class DynamicSort {
    AnySorter sorter_;

  public:
    explicit DynamicSort(SortAlgorithm algorithm = SortAlgorithm::fast)
        : sorter_(make_sorter(algorithm)) {}

    [[nodiscard]] SortAlgorithm algorithm() const noexcept {
        return std::holds_alternative<NaiveSort>(sorter_) ? SortAlgorithm::naive
                                                          : SortAlgorithm::fast;
    }

    [[nodiscard]] std::vector<Front> rank(std::span<const FitnessRecord> fitnesses,
                                          std::size_t k) const {
        return std::visit([&](const auto& sorter) { return sorter.rank(fitnesses, k); }, sorter_);
    }

    [[nodiscard]] std::vector<Front> rank_constrained(std::span<const FitnessRecord> fitnesses,
                                                      std::size_t k) const {
        return std::visit(
            [&](const auto& sorter) { return sorter.rank_constrained(fitnesses, k); }, sorter_);
    }
};

static_assert(core::FrontSorter<DynamicSort>);

/// @private
namespace detail {

/// Ranking used when nobody is feasible: the least violator alone, then everyone else
/// by increasing violation (ties by position)
inline std::vector<Front> all_infeasible_fronts(std::span<const FitnessRecord> fitnesses) {
    std::vector<std::size_t> order(fitnesses.size());
    std::iota(order.begin(), order.end(), 0);
    std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
        return fitnesses[a].total_violation() < fitnesses[b].total_violation();
    });

    std::vector<Front> fronts;
    fronts.push_back({order.front()});
    if (order.size() > 1) {
        fronts.emplace_back(order.begin() + 1, order.end());
    }
    return fronts;
}

} // namespace detail

/// Sort fitness records into fronts with a compile-time sorter
///
/// The result covers at least min(k, N) individuals, or every front when fewer exist.
/// With `constraint_aware`, a population without any feasible member is reported through
/// `all_infeasible` and ranked as two tiers.
///
/// @throws core::DimensionMismatchError on inconsistent objective vectors
template <core::FrontSorter Sorter>
[[nodiscard]] SortResult sort_fronts(const Sorter& sorter,
                                     std::span<const FitnessRecord> fitnesses, std::size_t k,
                                     bool constraint_aware) {
    SortResult result;
    if (k == 0 || fitnesses.empty()) {
        return result;
    }

    if (!constraint_aware) {
        result.fronts = sorter.rank(fitnesses, k);
        return result;
    }

    core::validate_dimensions(fitnesses);
    const bool any_feasible =
        std::ranges::any_of(fitnesses, [](const FitnessRecord& f) { return f.feasible(); });
    if (!any_feasible) {
        result.fronts = detail::all_infeasible_fronts(fitnesses);
        result.all_infeasible = true;
        return result;
    }

    result.fronts = sorter.rank_constrained(fitnesses, k);
    return result;
}

/// Sort fitness records into fronts with the sorter named in `options`
[[nodiscard]] inline SortResult sort_fronts(std::span<const FitnessRecord> fitnesses,
                                            std::size_t k, const SortOptions& options = {}) {
    return sort_fronts(DynamicSort(options.algorithm), fitnesses, k, options.constraint_aware);
}

/// Fronts of individual keys
struct KeyedSortResult {
    std::vector<std::vector<core::IndividualKey>> fronts;
    bool all_infeasible = false;
};

/// Sort a population and report fronts by key
template <typename DecisionT, typename StrategyT>
[[nodiscard]] KeyedSortResult sort_fronts(const core::Population<DecisionT, StrategyT>& population,
                                          std::size_t k, const SortOptions& options = {}) {
    const auto ranked = sort_fronts(population.fitness_values(), k, options);

    KeyedSortResult result;
    result.all_infeasible = ranked.all_infeasible;
    result.fronts.reserve(ranked.fronts.size());
    for (const auto& front : ranked.fronts) {
        result.fronts.push_back(population.keys_of(front));
    }
    return result;
}

} // namespace paretolab::sorting
