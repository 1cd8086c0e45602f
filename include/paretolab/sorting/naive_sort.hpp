#pragma once

/// @file naive_sort.hpp
/// @brief Dominance-counting non-dominated sort, O(M·N²)
///
/// Reference: Deb, Pratap, Agarwal and Meyarivan, "A fast and elitist multiobjective
/// genetic algorithm: NSGA-II", IEEE TEVC 6(2), 2002. Serves as the oracle for the
/// divide-and-conquer sorter and as the sorter of choice for small populations.

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <span>
#include <vector>

#include <paretolab/core/concepts.hpp>
#include <paretolab/core/dominance.hpp>

namespace paretolab::sorting {

using core::FitnessRecord;
using core::Front;

/// @private
namespace detail {

/// Group positions whose records the relation cannot tell apart
///
/// Groups come out in the relation's order and members keep their relative order, so
/// the grouping is deterministic for a given input.
template <core::DominanceRelation R>
std::vector<std::vector<std::size_t>> group_equivalent(std::span<const FitnessRecord> fitnesses,
                                                       std::span<const std::size_t> positions,
                                                       const R& relation) {
    std::vector<std::size_t> order(positions.begin(), positions.end());
    std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
        return relation.order(fitnesses[a], fitnesses[b]);
    });

    std::vector<std::vector<std::size_t>> groups;
    for (const auto position : order) {
        if (!groups.empty() &&
            relation.equivalent(fitnesses[groups.back().front()], fitnesses[position])) {
            groups.back().push_back(position);
        } else {
            groups.push_back({position});
        }
    }
    return groups;
}

} // namespace detail

/// Front assignment by pairwise dominance counting
///
/// Every pair of distinct fitness classes is compared once; each class records how many
/// classes dominate it and which classes it dominates. Front 0 holds the classes nobody
/// dominates, and each following front is peeled off by releasing the classes dominated
/// by the previous one. Peeling stops as soon as min(k, N) individuals are ranked.
///
/// Individuals with identical records (as judged by the relation) are compared once and
/// expanded back into the same front.
///
/// @tparam Relation Dominance relation; ConstrainedDominance yields the constraint-aware
///         variant in which all feasible fronts precede the infeasible ones, and infeasible
///         individuals are ranked by increasing total violation.
template <core::DominanceRelation Relation = core::ParetoDominance>
class NaiveFrontAssigner {
    Relation relation_;

  public:
    explicit NaiveFrontAssigner(Relation relation = {}) : relation_(std::move(relation)) {}

    /// Rank positions of `fitnesses` into fronts covering at least min(k, N) individuals
    ///
    /// @throws core::DimensionMismatchError on inconsistent objective vectors
    [[nodiscard]] std::vector<Front> assign(std::span<const FitnessRecord> fitnesses,
                                            std::size_t k) const {
        if (k == 0 || fitnesses.empty()) {
            return {};
        }
        core::validate_dimensions(fitnesses);

        std::vector<std::size_t> positions(fitnesses.size());
        std::iota(positions.begin(), positions.end(), 0);
        const auto groups = detail::group_equivalent(fitnesses, positions, relation_);
        const std::size_t num_groups = groups.size();

        std::vector<std::size_t> dominated_by(num_groups, 0);
        std::vector<std::vector<std::size_t>> dominated_groups(num_groups);

        for (std::size_t i = 0; i < num_groups; ++i) {
            const auto& fi = fitnesses[groups[i].front()];
            for (std::size_t j = i + 1; j < num_groups; ++j) {
                const auto& fj = fitnesses[groups[j].front()];
                if (relation_.dominates(fi, fj)) {
                    ++dominated_by[j];
                    dominated_groups[i].push_back(j);
                } else if (relation_.dominates(fj, fi)) {
                    ++dominated_by[i];
                    dominated_groups[j].push_back(i);
                }
            }
        }

        std::vector<std::size_t> current;
        for (std::size_t g = 0; g < num_groups; ++g) {
            if (dominated_by[g] == 0) {
                current.push_back(g);
            }
        }

        std::vector<Front> fronts;
        std::size_t ranked = 0;
        const std::size_t target = std::min(k, fitnesses.size());

        auto emit = [&](const std::vector<std::size_t>& front_groups) {
            Front front;
            for (const auto g : front_groups) {
                front.insert(front.end(), groups[g].begin(), groups[g].end());
            }
            ranked += front.size();
            fronts.push_back(std::move(front));
        };

        emit(current);
        while (ranked < target && !current.empty()) {
            std::vector<std::size_t> next;
            for (const auto g : current) {
                for (const auto d : dominated_groups[g]) {
                    if (--dominated_by[d] == 0) {
                        next.push_back(d);
                    }
                }
            }
            if (next.empty()) {
                break;
            }
            emit(next);
            current = std::move(next);
        }

        return fronts;
    }
};

/// Sorter policy built on NaiveFrontAssigner
struct NaiveSort {
    [[nodiscard]] std::vector<Front> rank(std::span<const FitnessRecord> fitnesses,
                                          std::size_t k) const {
        return NaiveFrontAssigner<core::ParetoDominance>{}.assign(fitnesses, k);
    }

    /// Constraint-aware ranking over the whole population with ConstrainedDominance
    [[nodiscard]] std::vector<Front> rank_constrained(std::span<const FitnessRecord> fitnesses,
                                                      std::size_t k) const {
        return NaiveFrontAssigner<core::ConstrainedDominance>{}.assign(fitnesses, k);
    }
};

static_assert(core::FrontSorter<NaiveSort>);

} // namespace paretolab::sorting
