#pragma once

/// @file survival.hpp
/// @brief Environmental selection: whole fronts first, then a diversity operator for the rest
///
/// Two diversity operators are provided:
/// - CrowdingSurvival: NSGA-II, descending crowding distance on the last front
/// - ReferenceDirectionSurvival: NSGA-III, normalization, niche association and
///   least-used-niche selection

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <numeric>
#include <optional>
#include <random>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <paretolab/core/concepts.hpp>
#include <paretolab/core/population.hpp>
#include <paretolab/niching/association.hpp>
#include <paretolab/niching/niching.hpp>
#include <paretolab/niching/normalization.hpp>
#include <paretolab/niching/reference_points.hpp>
#include <paretolab/operators/crowding.hpp>
#include <paretolab/sorting/nondominated_sort.hpp>

#ifdef PARETOLAB_HAVE_TBB
#include <paretolab/parallel/tbb_associator.hpp>
#endif

namespace paretolab::operators {

using core::FitnessRecord;
using core::Front;

/// What happens to the niche occupancy table between selection calls
enum class NicheCountPolicy {
    reset, ///< Counts start from the accepted fronts on every call
    carry  ///< Counts of the previous call are added to those of the accepted fronts
};

enum class SurvivalStrategy { nsga3, nsga2 };

/// Record of one selection call
struct SelectionStats {
    std::size_t call = 0;
    std::size_t population_size = 0;
    std::size_t requested = 0;
    std::size_t selected = 0;
    std::size_t front_count = 0;     ///< Fronts produced by the sorter
    std::size_t accepted_fronts = 0; ///< Fronts taken whole
    std::size_t last_front_size = 0; ///< Size of the front split by the diversity operator
    std::size_t diversity_filled = 0;
    bool all_infeasible = false;
    std::optional<niching::InterceptSource> intercept_source;
    std::chrono::microseconds elapsed{0};
};

struct SelectionResult {
    std::vector<std::size_t> selected; ///< Distinct positions, accepted fronts first
    SelectionStats stats;
};

/// Selection parameters, usually produced by config::Config::to_selection_config()
struct SelectionConfig {
    sorting::SortOptions sort;
    SurvivalStrategy strategy = SurvivalStrategy::nsga3;
    std::size_t population_size = 100;

    // Reference directions (NSGA-III only); outermost layer first
    std::vector<niching::ReferenceLayer> reference_layers{{12, 1.0}};

    std::uint64_t seed = 1;
    NicheCountPolicy niche_count_policy = NicheCountPolicy::reset;
    bool track_normalization = true;

    bool parallel = false;
    std::size_t grain_size = 64;

    std::size_t history_limit = 100; // 0 keeps no history
};

/// Concept for operators that fill the remaining slots from the last front
///
/// `fill` receives the fully accepted fronts and the front to split, and returns exactly
/// `slots` distinct positions taken from `last`.
template <typename D>
concept DiversityOperator =
    requires(D& op, std::span<const FitnessRecord> fitnesses, std::span<const Front> accepted,
             std::span<const std::size_t> last, std::size_t slots, std::mt19937& rng,
             SelectionStats& stats) {
        { op.fill(fitnesses, accepted, last, slots, rng, stats) }
            -> std::same_as<std::vector<std::size_t>>;
    };

/// NSGA-II truncation: members of the last front by descending crowding distance
///
/// Ties keep the lower position first, so the result does not depend on the order in which
/// the sorter listed the front.
class CrowdingSurvival {
  public:
    [[nodiscard]] std::vector<std::size_t> fill(std::span<const FitnessRecord> fitnesses,
                                                std::span<const Front> /*accepted*/,
                                                std::span<const std::size_t> last,
                                                std::size_t slots, std::mt19937& /*rng*/,
                                                SelectionStats& /*stats*/) {
        const auto distances = crowding_distance(fitnesses, last);

        std::vector<std::size_t> order(last.size());
        std::iota(order.begin(), order.end(), 0);
        std::ranges::sort(order, [&](std::size_t a, std::size_t b) {
            if (distances[a] != distances[b]) {
                return distances[a] > distances[b];
            }
            return last[a] < last[b];
        });

        std::vector<std::size_t> picks;
        picks.reserve(slots);
        for (std::size_t i = 0; i < slots && i < order.size(); ++i) {
            picks.push_back(last[order[i]]);
        }
        return picks;
    }
};

/// NSGA-III truncation by reference directions
///
/// Reference: Deb and Jain, IEEE TEVC 18(4), 2014, Algorithms 2 to 4.
///
/// The union of the accepted fronts and the last front is normalized by its ideal point and
/// hyperplane intercepts and associated with the reference directions. Niche counts come
/// from the accepted fronts, and the last front fills the remaining slots by least-used-niche
/// selection.
class ReferenceDirectionSurvival {
  private:
    std::vector<niching::ReferencePoint> references_;
    std::vector<niching::ReferenceLayer> layers_;
    NicheCountPolicy policy_ = NicheCountPolicy::reset;
    bool track_normalization_ = true;
    bool parallel_ = false;
    std::size_t grain_size_ = 64;

    niching::NormalizationMemory memory_;
    std::vector<std::size_t> niche_counts_;

  public:
    /// Fixed reference directions
    explicit ReferenceDirectionSurvival(std::vector<niching::ReferencePoint> references,
                                        NicheCountPolicy policy = NicheCountPolicy::reset,
                                        bool track_normalization = true)
        : references_(std::move(references)), policy_(policy),
          track_normalization_(track_normalization) {
        if (references_.empty()) {
            throw std::invalid_argument("NSGA-III survival needs at least one reference point");
        }
    }

    /// Reference directions generated from layers once the number of objectives is known
    [[nodiscard]] static ReferenceDirectionSurvival
    from_layers(std::vector<niching::ReferenceLayer> layers,
                NicheCountPolicy policy = NicheCountPolicy::reset, bool track_normalization = true) {
        if (layers.empty()) {
            throw std::invalid_argument("NSGA-III survival needs at least one reference layer");
        }
        ReferenceDirectionSurvival survival;
        survival.layers_ = std::move(layers);
        survival.policy_ = policy;
        survival.track_normalization_ = track_normalization;
        return survival;
    }

    /// Associate on TBB worker threads; ignored unless built with PARETOLAB_HAVE_TBB
    void set_parallel(bool enabled, std::size_t grain_size = 64) {
        parallel_ = enabled;
        grain_size_ = grain_size;
    }

    [[nodiscard]] std::span<const niching::ReferencePoint> references() const noexcept {
        return references_;
    }

    [[nodiscard]] const niching::NormalizationMemory& memory() const noexcept { return memory_; }

    /// Niche occupancy after the last call
    [[nodiscard]] std::span<const std::size_t> niche_counts() const noexcept {
        return niche_counts_;
    }

    /// Forget carried niche counts and normalization memory
    void reset() noexcept {
        memory_.reset();
        niche_counts_.clear();
    }

    [[nodiscard]] std::vector<std::size_t> fill(std::span<const FitnessRecord> fitnesses,
                                                std::span<const Front> accepted,
                                                std::span<const std::size_t> last,
                                                std::size_t slots, std::mt19937& rng,
                                                SelectionStats& stats) {
        const std::size_t m = core::validate_dimensions(fitnesses);
        ensure_references(m);

        std::vector<std::size_t> chosen;
        for (const auto& front : accepted) {
            chosen.insert(chosen.end(), front.begin(), front.end());
        }
        const std::size_t num_accepted = chosen.size();
        chosen.insert(chosen.end(), last.begin(), last.end());

        std::vector<std::size_t> everyone(fitnesses.size());
        std::iota(everyone.begin(), everyone.end(), 0);

        auto ideal = niching::ideal_point(fitnesses, chosen);
        auto current_worst = niching::worst_point(fitnesses, everyone);
        const auto front_worst = niching::worst_point(fitnesses, chosen);
        std::span<const niching::Point> previous_extremes;
        if (track_normalization_) {
            ideal = memory_.merged_ideal(ideal);
            current_worst = memory_.merged_worst(current_worst);
            previous_extremes = memory_.extremes();
        }

        auto extremes = niching::find_extreme_points(fitnesses, chosen, ideal, previous_extremes);
        const auto intercepts =
            niching::find_intercepts(extremes, ideal, current_worst, front_worst);
        stats.intercept_source = intercepts.source;
        if (track_normalization_) {
            memory_.update(ideal, current_worst, std::move(extremes));
        }

        const auto association = associate(fitnesses, chosen, ideal, intercepts.values);

        const std::span<const std::size_t> niches(association.niches);
        auto counts = niching::count_niches(niches.first(num_accepted), references_.size());
        if (policy_ == NicheCountPolicy::carry && niche_counts_.size() == counts.size()) {
            for (std::size_t r = 0; r < counts.size(); ++r) {
                counts[r] += niche_counts_[r];
            }
        }

        const auto picks = niching::select_by_niching(
            niches.subspan(num_accepted),
            std::span<const double>(association.distances).subspan(num_accepted), slots, counts,
            rng);
        niche_counts_ = std::move(counts);

        std::vector<std::size_t> selected;
        selected.reserve(picks.size());
        for (const auto pick : picks) {
            selected.push_back(last[pick]);
        }
        return selected;
    }

  private:
    ReferenceDirectionSurvival() = default;

    void ensure_references(std::size_t num_objectives) {
        if (!layers_.empty() &&
            (references_.empty() || references_.front().size() != num_objectives)) {
            references_ = niching::layered_reference_points(num_objectives, layers_);
            reset();
        }
    }

    [[nodiscard]] niching::Association associate(std::span<const FitnessRecord> fitnesses,
                                                 std::span<const std::size_t> positions,
                                                 std::span<const double> ideal,
                                                 std::span<const double> intercepts) const {
#ifdef PARETOLAB_HAVE_TBB
        if (parallel_) {
            return parallel::TBBAssociator(grain_size_)
                .associate(fitnesses, positions, references_, ideal, intercepts);
        }
#endif
        return niching::associate_to_niches(fitnesses, positions, references_, ideal, intercepts);
    }
};

static_assert(DiversityOperator<CrowdingSurvival>);
static_assert(DiversityOperator<ReferenceDirectionSurvival>);

struct SurvivalOptions {
    bool constraint_aware = false;
    std::size_t history_limit = 100;
};

/// Environmental selection composed of a sorter and a diversity operator
///
/// Whole fronts are accepted while they fit into k; the first front that does not fit is
/// handed to the diversity operator for the remaining slots. Every call appends a
/// SelectionStats record to a history bounded by `history_limit`.
template <core::FrontSorter Sorter, DiversityOperator Diversity>
class SurvivalSelector {
  public:
    using SorterT = Sorter;
    using DiversityT = Diversity;

  private:
    Sorter sorter_;
    Diversity diversity_;
    SurvivalOptions options_;
    std::deque<SelectionStats> history_;
    std::size_t calls_ = 0;

  public:
    SurvivalSelector(Sorter sorter, Diversity diversity, SurvivalOptions options = {})
        : sorter_(std::move(sorter)), diversity_(std::move(diversity)), options_(options) {}

    /// Select min(k, N) distinct positions
    ///
    /// @throws core::DimensionMismatchError on inconsistent objective vectors
    [[nodiscard]] SelectionResult select(std::span<const FitnessRecord> fitnesses, std::size_t k,
                                         std::mt19937& rng) {
        const auto start_time = std::chrono::steady_clock::now();

        SelectionResult result;
        auto& stats = result.stats;
        stats.call = calls_++;
        stats.population_size = fitnesses.size();
        stats.requested = k;

        const auto sorted = sorting::sort_fronts(sorter_, fitnesses, k, options_.constraint_aware);
        stats.front_count = sorted.fronts.size();
        stats.all_infeasible = sorted.all_infeasible;

        const std::size_t target = std::min(k, fitnesses.size());
        std::size_t accepted = 0;
        for (const auto& front : sorted.fronts) {
            if (result.selected.size() + front.size() > target) {
                break;
            }
            result.selected.insert(result.selected.end(), front.begin(), front.end());
            ++accepted;
        }
        stats.accepted_fronts = accepted;

        const std::size_t slots = target - result.selected.size();
        if (slots > 0) {
            const auto& last = sorted.fronts[accepted];
            stats.last_front_size = last.size();

            const std::span<const Front> whole(sorted.fronts.data(), accepted);
            const auto picks = diversity_.fill(fitnesses, whole, last, slots, rng, stats);
            result.selected.insert(result.selected.end(), picks.begin(), picks.end());
            stats.diversity_filled = picks.size();
        }

        stats.selected = result.selected.size();
        stats.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time);
        record(stats);
        return result;
    }

    /// Select from a population and report survivors by key
    template <typename DecisionT, typename StrategyT>
    [[nodiscard]] std::vector<core::IndividualKey>
    select_keys(const core::Population<DecisionT, StrategyT>& population, std::size_t k,
                std::mt19937& rng) {
        const auto result = select(population.fitness_values(), k, rng);
        return population.keys_of(result.selected);
    }

    [[nodiscard]] const std::deque<SelectionStats>& history() const noexcept { return history_; }

    void clear_history() noexcept { history_.clear(); }

    [[nodiscard]] const Sorter& sorter() const noexcept { return sorter_; }
    [[nodiscard]] Diversity& diversity() noexcept { return diversity_; }
    [[nodiscard]] const Diversity& diversity() const noexcept { return diversity_; }
    [[nodiscard]] const SurvivalOptions& options() const noexcept { return options_; }

  private:
    void record(const SelectionStats& stats) {
        if (options_.history_limit == 0) {
            return;
        }
        history_.push_back(stats);
        while (history_.size() > options_.history_limit) {
            history_.pop_front();
        }
    }
};

/// Factory function for survival selectors
template <core::FrontSorter S, DiversityOperator D>
[[nodiscard]] SurvivalSelector<S, D> make_survival(S sorter, D diversity,
                                                   SurvivalOptions options = {}) {
    return SurvivalSelector<S, D>(std::move(sorter), std::move(diversity), options);
}

} // namespace paretolab::operators
