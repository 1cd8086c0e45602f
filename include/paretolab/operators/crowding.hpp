#pragma once

/// @file crowding.hpp
/// @brief NSGA-II crowding distance
///
/// Reference: Deb, Pratap, Agarwal and Meyarivan, "A fast and elitist multiobjective
/// genetic algorithm: NSGA-II", IEEE TEVC 6(2), 2002.

#include <algorithm>
#include <cstddef>
#include <limits>
#include <numeric>
#include <span>
#include <unordered_map>
#include <vector>

#include <paretolab/core/concepts.hpp>
#include <paretolab/core/population.hpp>

namespace paretolab::operators {

using core::FitnessRecord;

/// Crowding distance of every member of a front
///
/// For each objective the members are ordered by value (ties by front order); the first and
/// last get an infinite distance and each interior member accumulates
/// `(next - prev) / (M * (max - min))`. An objective on which all members are equal is
/// skipped and contributes nothing, boundaries included.
///
/// @param front Positions into `fitnesses`
/// @return Distance of `front[i]` at index i
/// @throws core::DimensionMismatchError on inconsistent objective vectors
[[nodiscard]] inline std::vector<double> crowding_distance(std::span<const FitnessRecord> fitnesses,
                                                           std::span<const std::size_t> front) {
    std::vector<double> distances(front.size(), 0.0);
    if (front.empty()) {
        return distances;
    }

    const std::size_t m = fitnesses[front.front()].objectives.size();
    for (const auto position : front) {
        if (fitnesses[position].objectives.size() != m) {
            throw core::DimensionMismatchError("Crowding distance over objective vectors of "
                                               "differing length");
        }
    }

    std::vector<std::size_t> order(front.size());
    const double inf = std::numeric_limits<double>::infinity();
    const double num_objectives = static_cast<double>(m);

    for (std::size_t obj = 0; obj < m; ++obj) {
        auto value = [&](std::size_t i) { return fitnesses[front[i]].objectives[obj]; };

        std::iota(order.begin(), order.end(), 0);
        std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
            return value(a) < value(b);
        });

        const double low = value(order.front());
        const double high = value(order.back());
        if (low == high) {
            continue;
        }

        distances[order.front()] = inf;
        distances[order.back()] = inf;

        const double norm = num_objectives * (high - low);
        for (std::size_t j = 1; j + 1 < order.size(); ++j) {
            distances[order[j]] += (value(order[j + 1]) - value(order[j - 1])) / norm;
        }
    }
    return distances;
}

/// Crowding distance of front members keyed by individual
template <typename DecisionT, typename StrategyT>
[[nodiscard]] std::unordered_map<core::IndividualKey, double>
assign_crowding_distance(const core::Population<DecisionT, StrategyT>& population,
                         std::span<const std::size_t> front) {
    const auto distances = crowding_distance(population.fitness_values(), front);

    std::unordered_map<core::IndividualKey, double> by_key;
    by_key.reserve(front.size());
    for (std::size_t i = 0; i < front.size(); ++i) {
        by_key.emplace(population.key(front[i]), distances[i]);
    }
    return by_key;
}

} // namespace paretolab::operators
