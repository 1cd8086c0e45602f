#pragma once

/// @file json_report.hpp
/// @brief JSON renderings of sort results, selection statistics and reference sets
///
/// The library never prints; callers decide where the documents go, typically with
/// `dump(2)`.

#include <cmath>
#include <cstddef>
#include <deque>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

#include <paretolab/config/config.hpp>
#include <paretolab/core/concepts.hpp>
#include <paretolab/niching/normalization.hpp>
#include <paretolab/niching/reference_points.hpp>
#include <paretolab/operators/survival.hpp>

namespace paretolab::io {

using json = nlohmann::json;

/// @private
namespace detail {

/// JSON has no infinity; boundary crowding distances are written as null
inline json finite_or_null(double value) {
    return std::isfinite(value) ? json(value) : json(nullptr);
}

} // namespace detail

/// Fronts of positions with their sizes
[[nodiscard]] inline json to_json(const core::SortResult& result) {
    json fronts = json::array();
    json sizes = json::array();
    for (const auto& front : result.fronts) {
        fronts.push_back(front);
        sizes.push_back(front.size());
    }

    return {{"front_count", result.fronts.size()},
            {"ranked", result.ranked()},
            {"all_infeasible", result.all_infeasible},
            {"front_sizes", sizes},
            {"fronts", fronts}};
}

[[nodiscard]] inline json to_json(const operators::SelectionStats& stats) {
    json out = {{"call", stats.call},
                {"population_size", stats.population_size},
                {"requested", stats.requested},
                {"selected", stats.selected},
                {"front_count", stats.front_count},
                {"accepted_fronts", stats.accepted_fronts},
                {"last_front_size", stats.last_front_size},
                {"diversity_filled", stats.diversity_filled},
                {"all_infeasible", stats.all_infeasible},
                {"elapsed_us", stats.elapsed.count()}};

    if (stats.intercept_source) {
        out["intercept_source"] = niching::to_string(*stats.intercept_source);
    } else {
        out["intercept_source"] = nullptr;
    }
    return out;
}

/// Selection history, oldest first
[[nodiscard]] inline json to_json(const std::deque<operators::SelectionStats>& history) {
    json out = json::array();
    for (const auto& stats : history) {
        out.push_back(to_json(stats));
    }
    return out;
}

[[nodiscard]] inline json to_json(std::span<const niching::ReferencePoint> points) {
    json out;
    out["count"] = points.size();
    out["num_objectives"] = points.empty() ? 0 : points.front().size();
    out["points"] = json::array();
    for (const auto& point : points) {
        out["points"].push_back(point);
    }
    return out;
}

/// Crowding distances in front order; infinite distances become null
[[nodiscard]] inline json crowding_to_json(std::span<const std::size_t> front,
                                           std::span<const double> distances) {
    json out = json::array();
    for (std::size_t i = 0; i < front.size() && i < distances.size(); ++i) {
        out.push_back({{"position", front[i]}, {"distance", detail::finite_or_null(distances[i])}});
    }
    return out;
}

/// Configuration section as used in selection reports
[[nodiscard]] inline json to_json(const config::Config& cfg) {
    json refs = {{"divisions", cfg.reference_points.divisions}};
    if (cfg.reference_points.scaling) {
        refs["scaling"] = *cfg.reference_points.scaling;
    }
    if (cfg.reference_points.inner_divisions) {
        refs["inner_divisions"] = *cfg.reference_points.inner_divisions;
    }
    if (cfg.reference_points.inner_scaling) {
        refs["inner_scaling"] = *cfg.reference_points.inner_scaling;
    }

    return {{"sorting",
             {{"algorithm", cfg.sorting.algorithm},
              {"constraint_aware", cfg.sorting.constraint_aware}}},
            {"survival",
             {{"strategy", cfg.survival.strategy},
              {"population_size", cfg.survival.population_size}}},
            {"reference_points", refs},
            {"niching",
             {{"seed", cfg.niching.seed},
              {"niche_count_policy", cfg.niching.niche_count_policy},
              {"track_normalization", cfg.niching.track_normalization}}},
            {"parallel",
             {{"enabled", cfg.parallel.enabled}, {"grain_size", cfg.parallel.grain_size}}}};
}

/// Full report of a selection run: configuration, last result and history
[[nodiscard]] inline json selection_report(const config::Config& cfg,
                                           const operators::SelectionResult& result,
                                           const std::deque<operators::SelectionStats>& history) {
    json out;
    out["configuration"] = to_json(cfg);
    out["selected"] = result.selected;
    out["last_call"] = to_json(result.stats);
    out["history"] = to_json(history);
    return out;
}

} // namespace paretolab::io
