#pragma once

/// @file fast_sort.hpp
/// @brief Divide-and-conquer non-dominated sort, O(N log^(M-1) N)
///
/// References:
/// - Jensen, "Reducing the run-time complexity of multiobjective EAs: The NSGA-II and other
///   algorithms", IEEE TEVC 7(5), 2003.
/// - Fortin, Grenier and Parizeau, "Generalizing the improved run-time complexity algorithm
///   for non-dominated sorting", GECCO 2013.
///
/// Produces the same partition into fronts as NaiveFrontAssigner for every input.

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <iterator>
#include <numeric>
#include <span>
#include <tuple>
#include <utility>
#include <vector>

#include <paretolab/core/concepts.hpp>
#include <paretolab/core/dominance.hpp>
#include <paretolab/sorting/naive_sort.hpp>
#include <paretolab/utils/compiler_hints.hpp>

namespace paretolab::sorting {

/// @private
namespace detail {

/// Keep the leading fronts until they hold at least k individuals
inline void truncate_to_cover(std::vector<Front>& fronts, std::size_t k) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < fronts.size(); ++i) {
        count += fronts[i].size();
        if (count >= k) {
            fronts.resize(i + 1);
            return;
        }
    }
}

/// Fronts of infeasible positions, one per distinct total violation, by increasing violation
inline std::vector<Front> violation_fronts(std::span<const FitnessRecord> fitnesses,
                                           std::span<const std::size_t> positions) {
    std::vector<std::pair<double, std::size_t>> by_violation;
    by_violation.reserve(positions.size());
    for (const auto position : positions) {
        by_violation.emplace_back(fitnesses[position].total_violation(), position);
    }
    std::ranges::sort(by_violation);

    std::vector<Front> fronts;
    for (std::size_t i = 0; i < by_violation.size(); ++i) {
        if (i == 0 || by_violation[i].first != by_violation[i - 1].first) {
            fronts.emplace_back();
        }
        fronts.back().push_back(by_violation[i].second);
    }
    return fronts;
}

/// Recursive ranking state over unique, lexicographically ascending objective vectors
///
/// Two invariants hold throughout:
/// - inside `sort_a(S, obj)` all members of S agree on objectives above `obj`;
/// - inside `sort_b(L, H, obj)` every member of L is no worse than every member of H on
///   objectives above `obj`, and the ranks of L are final.
class DivideAndConquerRanker {
  public:
    using List = std::vector<std::size_t>;

    explicit DivideAndConquerRanker(std::vector<std::span<const double>> points)
        : points_(std::move(points)), rank_(points_.size(), 0) {}

    /// Rank every point; points must be distinct and sorted lexicographically ascending
    std::vector<std::size_t> run(std::size_t num_objectives) {
        List all(points_.size());
        std::iota(all.begin(), all.end(), 0);

        if (num_objectives == 1) {
            // Distinct scalars in ascending order: each one is its own front
            rank_ = all;
        } else {
            sort_a(all, num_objectives - 1);
        }
        return rank_;
    }

  private:
    struct Stair {
        double value;
        std::size_t rank;
    };

    std::vector<std::span<const double>> points_;
    std::vector<std::size_t> rank_;

    [[nodiscard]] double value(std::size_t i, std::size_t obj) const { return points_[i][obj]; }

    void raise(std::size_t target, std::size_t source) {
        rank_[target] = std::max(rank_[target], rank_[source] + 1);
    }

    [[nodiscard]] bool dominates_upto(std::size_t a, std::size_t b, std::size_t obj) const {
        return core::dominates(points_[a].first(obj + 1), points_[b].first(obj + 1));
    }

    [[nodiscard]] bool weakly_dominates_upto(std::size_t a, std::size_t b,
                                             std::size_t obj) const {
        for (std::size_t i = 0; i <= obj; ++i) {
            if (value(a, i) > value(b, i)) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] bool all_equal(const List& list, std::size_t obj) const {
        const double first = value(list.front(), obj);
        return std::ranges::all_of(list, [&](std::size_t i) { return value(i, obj) == first; });
    }

    /// Median of objective `obj`; mean of the two middle values for even sizes
    [[nodiscard]] double median(const List& list, std::size_t obj) const {
        std::vector<double> values;
        values.reserve(list.size());
        for (const auto i : list) {
            values.push_back(value(i, obj));
        }

        const std::size_t mid = (values.size() - 1) / 2;
        std::nth_element(values.begin(), values.begin() + mid, values.end());
        const double low = values[mid];
        if (values.size() % 2 == 1) {
            return low;
        }
        const double high = *std::min_element(values.begin() + mid + 1, values.end());
        return (low + high) / 2.0;
    }

    static std::ptrdiff_t ssize(const List& list) {
        return static_cast<std::ptrdiff_t>(list.size());
    }

    /// Split on the median of `obj`; ties go to whichever side balances the halves better
    [[nodiscard]] std::pair<List, List> split_a(const List& list, std::size_t obj) const {
        const double m = median(list, obj);
        List best_a, worst_a, best_b, worst_b;

        for (const auto i : list) {
            const double v = value(i, obj);
            if (v < m) {
                best_a.push_back(i);
                best_b.push_back(i);
            } else if (v > m) {
                worst_a.push_back(i);
                worst_b.push_back(i);
            } else {
                best_a.push_back(i);
                worst_b.push_back(i);
            }
        }

        const auto balance_a = std::abs(ssize(best_a) - ssize(worst_a));
        const auto balance_b = std::abs(ssize(best_b) - ssize(worst_b));
        if (balance_a <= balance_b) {
            return {std::move(best_a), std::move(worst_a)};
        }
        return {std::move(best_b), std::move(worst_b)};
    }

    /// Split both sets on the median of the larger one, keeping the four parts balanced
    [[nodiscard]] std::tuple<List, List, List, List> split_b(const List& best, const List& worst,
                                                             std::size_t obj) const {
        const double m = median(best.size() > worst.size() ? best : worst, obj);

        auto partition = [&](const List& list, List& low_a, List& high_a, List& low_b,
                             List& high_b) {
            for (const auto i : list) {
                const double v = value(i, obj);
                if (v < m) {
                    low_a.push_back(i);
                    low_b.push_back(i);
                } else if (v > m) {
                    high_a.push_back(i);
                    high_b.push_back(i);
                } else {
                    low_a.push_back(i);
                    high_b.push_back(i);
                }
            }
        };

        List best1_a, best2_a, best1_b, best2_b;
        List worst1_a, worst2_a, worst1_b, worst2_b;
        partition(best, best1_a, best2_a, best1_b, best2_b);
        partition(worst, worst1_a, worst2_a, worst1_b, worst2_b);

        const auto balance_a =
            std::abs(ssize(best1_a) - ssize(best2_a) + ssize(worst1_a) - ssize(worst2_a));
        const auto balance_b =
            std::abs(ssize(best1_b) - ssize(best2_b) + ssize(worst1_b) - ssize(worst2_b));
        if (balance_a <= balance_b) {
            return {std::move(best1_a), std::move(best2_a), std::move(worst1_a),
                    std::move(worst2_a)};
        }
        return {std::move(best1_b), std::move(best2_b), std::move(worst1_b), std::move(worst2_b)};
    }

    /// First stair whose value exceeds `v`
    static std::vector<Stair>::iterator upper_stair(std::vector<Stair>& stairs, double v) {
        return std::upper_bound(stairs.begin(), stairs.end(), v,
                                [](double x, const Stair& s) { return x < s.value; });
    }

    /// Put (v, r) on the staircase at `it`, dropping the entries it makes redundant
    ///
    /// Stairs are ascending in value and strictly ascending in rank; an entry above the new
    /// one with a rank no higher than `r` can never again be the tightest dominator.
    static void place_stair(std::vector<Stair>& stairs, std::vector<Stair>::iterator it, double v,
                            std::size_t r) {
        auto last = it;
        while (last != stairs.end() && last->rank <= r) {
            ++last;
        }
        it = stairs.erase(it, last);
        stairs.insert(it, Stair{v, r});
    }

    /// Rank a set on its first two objectives with a sweep over ascending objective 0
    void sweep_a(const List& list) {
        std::vector<Stair> stairs;
        stairs.reserve(list.size());

        for (const auto i : list) {
            const double v = value(i, 1);
            auto it = upper_stair(stairs, v);
            if (it != stairs.begin()) {
                rank_[i] = std::max(rank_[i], std::prev(it)->rank + 1);
            }
            place_stair(stairs, it, v, rank_[i]);
        }
    }

    /// Raise the ranks of `worst` from the fixed ranks of `best` on the first two objectives
    void sweep_b(const List& best, const List& worst) {
        std::vector<Stair> stairs;
        stairs.reserve(best.size());
        std::size_t next = 0;

        auto precedes = [&](std::size_t l, std::size_t h) {
            return value(l, 0) < value(h, 0) ||
                   (value(l, 0) == value(h, 0) && value(l, 1) <= value(h, 1));
        };

        for (const auto h : worst) {
            for (; next < best.size() && precedes(best[next], h); ++next) {
                const auto l = best[next];
                const double v = value(l, 1);
                auto it = upper_stair(stairs, v);
                if (it != stairs.begin() && std::prev(it)->rank >= rank_[l]) {
                    continue;
                }
                place_stair(stairs, it, v, rank_[l]);
            }

            auto it = upper_stair(stairs, value(h, 1));
            if (it != stairs.begin()) {
                rank_[h] = std::max(rank_[h], std::prev(it)->rank + 1);
            }
        }
    }

    void sort_a(const List& list, std::size_t obj) {
        if (PARETOLAB_UNLIKELY(list.size() < 2)) {
            return;
        }
        if (list.size() == 2) {
            if (dominates_upto(list[0], list[1], obj)) {
                raise(list[1], list[0]);
            }
            return;
        }
        if (obj == 1) {
            sweep_a(list);
            return;
        }
        if (all_equal(list, obj)) {
            sort_a(list, obj - 1);
            return;
        }

        const auto [best, worst] = split_a(list, obj);
        sort_a(best, obj);
        sort_b(best, worst, obj - 1);
        sort_a(worst, obj);
    }

    void sort_b(const List& best, const List& worst, std::size_t obj) {
        if (best.empty() || worst.empty()) {
            return;
        }
        if (best.size() == 1 || worst.size() == 1) {
            for (const auto h : worst) {
                for (const auto l : best) {
                    if (weakly_dominates_upto(l, h, obj)) {
                        raise(h, l);
                    }
                }
            }
            return;
        }
        if (obj == 1) {
            sweep_b(best, worst);
            return;
        }

        auto by_obj = [&](std::size_t a, std::size_t b) { return value(a, obj) < value(b, obj); };
        const auto [best_min, best_max] = std::ranges::minmax_element(best, by_obj);
        const auto [worst_min, worst_max] = std::ranges::minmax_element(worst, by_obj);

        if (value(*best_max, obj) <= value(*worst_min, obj)) {
            // Every member of best is no worse on obj: the objective carries no information
            sort_b(best, worst, obj - 1);
        } else if (value(*best_min, obj) <= value(*worst_max, obj)) {
            const auto [best1, best2, worst1, worst2] = split_b(best, worst, obj);
            sort_b(best1, worst1, obj);
            sort_b(best1, worst2, obj - 1);
            sort_b(best2, worst2, obj);
        }
    }
};

} // namespace detail

/// Front assignment by divide and conquer with a two-objective sweep
///
/// Works on unique objective vectors only: duplicates are grouped first and share the rank
/// of their representative. Recursion depth is bounded by about M·log2(N).
class FastFrontAssigner {
  public:
    /// Rank every position of `fitnesses` into fronts covering at least min(k, N) individuals
    ///
    /// @throws core::DimensionMismatchError on inconsistent objective vectors
    [[nodiscard]] std::vector<Front> assign(std::span<const FitnessRecord> fitnesses,
                                            std::size_t k) const {
        std::vector<std::size_t> positions(fitnesses.size());
        std::iota(positions.begin(), positions.end(), 0);
        return assign(fitnesses, positions, k);
    }

    /// Rank a subset of positions of `fitnesses`
    [[nodiscard]] std::vector<Front> assign(std::span<const FitnessRecord> fitnesses,
                                            std::span<const std::size_t> positions,
                                            std::size_t k) const {
        if (k == 0 || positions.empty()) {
            return {};
        }
        const std::size_t num_objectives = core::validate_dimensions(fitnesses);

        auto fronts = rank_all(fitnesses, positions, num_objectives);
        detail::truncate_to_cover(fronts, k);
        return fronts;
    }

  private:
    static std::vector<Front> rank_all(std::span<const FitnessRecord> fitnesses,
                                       std::span<const std::size_t> positions,
                                       std::size_t num_objectives) {
        const auto groups =
            detail::group_equivalent(fitnesses, positions, core::ParetoDominance{});

        std::vector<std::span<const double>> points;
        points.reserve(groups.size());
        for (const auto& group : groups) {
            points.emplace_back(fitnesses[group.front()].objectives);
        }

        detail::DivideAndConquerRanker ranker(std::move(points));
        const auto ranks = ranker.run(num_objectives);

        const std::size_t num_fronts = *std::ranges::max_element(ranks) + 1;
        std::vector<Front> fronts(num_fronts);
        for (std::size_t g = 0; g < groups.size(); ++g) {
            auto& front = fronts[ranks[g]];
            front.insert(front.end(), groups[g].begin(), groups[g].end());
        }
        return fronts;
    }
};

/// Sorter policy built on FastFrontAssigner
struct FastSort {
    [[nodiscard]] std::vector<Front> rank(std::span<const FitnessRecord> fitnesses,
                                          std::size_t k) const {
        return FastFrontAssigner{}.assign(fitnesses, k);
    }

    /// Rank the feasible subset, then append the infeasible individuals as one front per
    /// distinct total violation, by increasing violation
    [[nodiscard]] std::vector<Front> rank_constrained(std::span<const FitnessRecord> fitnesses,
                                                      std::size_t k) const {
        if (k == 0 || fitnesses.empty()) {
            return {};
        }
        core::validate_dimensions(fitnesses);

        std::vector<std::size_t> feasible;
        std::vector<std::size_t> infeasible;
        for (std::size_t i = 0; i < fitnesses.size(); ++i) {
            (fitnesses[i].feasible() ? feasible : infeasible).push_back(i);
        }

        auto fronts = FastFrontAssigner{}.assign(fitnesses, feasible, fitnesses.size());
        auto tail = detail::violation_fronts(fitnesses, infeasible);
        std::ranges::move(tail, std::back_inserter(fronts));

        detail::truncate_to_cover(fronts, k);
        return fronts;
    }
};

static_assert(core::FrontSorter<FastSort>);

} // namespace paretolab::sorting
