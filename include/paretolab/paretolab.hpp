#pragma once

// Core components
#include "core/concepts.hpp"
#include "core/dominance.hpp"
#include "core/population.hpp"

// Non-dominated sorting
#include "sorting/fast_sort.hpp"
#include "sorting/naive_sort.hpp"
#include "sorting/nondominated_sort.hpp"

// Reference directions and niching
#include "niching/association.hpp"
#include "niching/niching.hpp"
#include "niching/normalization.hpp"
#include "niching/reference_points.hpp"

// Selection operators
#include "operators/crowding.hpp"
#include "operators/survival.hpp"

// Configuration
#include "config/config.hpp"

// IO
#include "io/json_report.hpp"

/**
 * @file paretolab.hpp
 * @brief Main header for ParetoLab - multi-objective selection for evolutionary algorithms
 *
 * ParetoLab ranks a population into Pareto fronts and picks the survivors of a generation.
 *
 * Key features:
 * - Dominance-counting and divide-and-conquer non-dominated sorting, plain or constrained
 * - NSGA-III reference-point niching with hyperplane normalization
 * - NSGA-II crowding distance
 * - Reproducible selection driven by an injected std::mt19937
 *
 * Basic usage:
 * @code
 * #include <paretolab/paretolab.hpp>
 * using namespace paretolab;
 *
 * std::vector<core::FitnessRecord> fitness = evaluate(offspring_and_parents);
 *
 * auto survival = factory::make_nsga3(3, 12);
 * std::mt19937 rng(42);
 * auto result = survival.select(fitness, 92, rng);
 * @endcode
 */

namespace paretolab {

/// Current version
constexpr const char* VERSION = "0.1.0";

/// Common type aliases
namespace types {
using FitnessRecord = core::FitnessRecord;
using Front = core::Front;
using IndividualKey = core::IndividualKey;
using ReferencePoint = niching::ReferencePoint;
} // namespace types

/// Factory functions for common configurations
namespace factory {

using Nsga3Survival =
    operators::SurvivalSelector<sorting::DynamicSort, operators::ReferenceDirectionSurvival>;
using Nsga2Survival = operators::SurvivalSelector<sorting::DynamicSort, operators::CrowdingSurvival>;

/// Survival selector of either strategy, picked at runtime
using AnySurvival = std::variant<Nsga3Survival, Nsga2Survival>;

/// Create an NSGA-III selector with a single uniform reference layer
inline auto make_nsga3(std::size_t num_objectives, std::size_t divisions,
                       sorting::SortAlgorithm algorithm = sorting::SortAlgorithm::fast) {
    return operators::make_survival(
        sorting::DynamicSort(algorithm),
        operators::ReferenceDirectionSurvival(
            niching::uniform_reference_points(num_objectives, divisions)));
}

/// Create an NSGA-II selector
inline auto make_nsga2(sorting::SortAlgorithm algorithm = sorting::SortAlgorithm::fast) {
    return operators::make_survival(sorting::DynamicSort(algorithm), operators::CrowdingSurvival{});
}

/// Create an NSGA-III selector from configuration
///
/// Reference directions are generated from the configured layers on the first call, once the
/// number of objectives is known.
inline Nsga3Survival make_nsga3_from_config(const operators::SelectionConfig& cfg) {
    auto survival = operators::ReferenceDirectionSurvival::from_layers(
        cfg.reference_layers, cfg.niche_count_policy, cfg.track_normalization);
    survival.set_parallel(cfg.parallel, cfg.grain_size);
    return operators::make_survival(
        sorting::DynamicSort(cfg.sort.algorithm), std::move(survival),
        operators::SurvivalOptions{cfg.sort.constraint_aware, cfg.history_limit});
}

/// Create an NSGA-II selector from configuration
inline Nsga2Survival make_nsga2_from_config(const operators::SelectionConfig& cfg) {
    return operators::make_survival(
        sorting::DynamicSort(cfg.sort.algorithm), operators::CrowdingSurvival{},
        operators::SurvivalOptions{cfg.sort.constraint_aware, cfg.history_limit});
}

/// Create the selector named by `[survival] strategy`
inline AnySurvival make_survival_from_config(const config::Config& cfg) {
    const auto selection = cfg.to_selection_config();
    if (selection.strategy == operators::SurvivalStrategy::nsga2) {
        return make_nsga2_from_config(selection);
    }
    return make_nsga3_from_config(selection);
}

} // namespace factory

} // namespace paretolab
