#pragma once

/// @file reference_points.hpp
/// @brief Simplex-lattice reference directions for NSGA-III
///
/// Reference: Deb and Jain, "An evolutionary many-objective optimization algorithm using
/// reference-point-based nondominated sorting approach, Part I", IEEE TEVC 18(4), 2014.

#include <cmath>
#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace paretolab::niching {

/// M-dimensional point on the simplex sum(coords) == 1
using ReferencePoint = std::vector<double>;

/// One concentric layer of a layered reference set
struct ReferenceLayer {
    std::size_t divisions;
    double scaling = 1.0;
};

/// Number of points of the lattice with `divisions` parts in `num_objectives` dimensions,
/// C(p + M - 1, M - 1)
[[nodiscard]] inline std::size_t reference_point_count(std::size_t num_objectives,
                                                       std::size_t divisions) {
    if (num_objectives == 0) {
        return 0;
    }
    // C(n, r) with r = M - 1, built incrementally so every intermediate is an exact integer
    const std::size_t n = divisions + num_objectives - 1;
    const std::size_t r = num_objectives - 1;
    std::size_t count = 1;
    for (std::size_t i = 1; i <= r; ++i) {
        count = count * (n - r + i) / i;
    }
    return count;
}

/// @private
namespace detail {

inline void generate_compositions(ReferencePoint& point, std::size_t depth, std::size_t left,
                                  std::size_t total, std::vector<ReferencePoint>& out) {
    if (depth + 1 == point.size()) {
        point[depth] = static_cast<double>(left) / static_cast<double>(total);
        out.push_back(point);
        return;
    }
    for (std::size_t i = 0; i <= left; ++i) {
        point[depth] = static_cast<double>(i) / static_cast<double>(total);
        generate_compositions(point, depth + 1, left - i, total, out);
    }
}

} // namespace detail

/// Uniform reference points on the unit simplex
///
/// Enumerates every composition of `divisions` into `num_objectives` non-negative parts;
/// a point's coordinates are the parts divided by `divisions`. Points come out in
/// lexicographic order of their parts. With `scaling`, every point is shrunk toward the
/// centroid: `point * scaling + (1 - scaling) / M`.
///
/// @throws std::invalid_argument if `num_objectives` or `divisions` is zero, or `scaling`
///         is not a finite positive value
[[nodiscard]] inline std::vector<ReferencePoint>
uniform_reference_points(std::size_t num_objectives, std::size_t divisions = 4,
                         std::optional<double> scaling = std::nullopt) {
    if (num_objectives == 0) {
        throw std::invalid_argument("Reference points need at least one objective");
    }
    if (divisions == 0) {
        throw std::invalid_argument("Reference points need at least one division");
    }
    if (scaling && (!std::isfinite(*scaling) || *scaling <= 0.0)) {
        throw std::invalid_argument("Reference point scaling must be finite and positive, got " +
                                    std::to_string(*scaling));
    }

    std::vector<ReferencePoint> points;
    points.reserve(reference_point_count(num_objectives, divisions));

    ReferencePoint point(num_objectives, 0.0);
    detail::generate_compositions(point, 0, divisions, divisions, points);

    if (scaling) {
        const double shift = (1.0 - *scaling) / static_cast<double>(num_objectives);
        for (auto& p : points) {
            for (auto& coord : p) {
                coord = coord * *scaling + shift;
            }
        }
    }
    return points;
}

/// Concatenation of several uniform layers, outermost first as given
///
/// The usual many-objective setup is a boundary layer with scaling 1 and an inner layer
/// with scaling 0.5, each with few divisions.
[[nodiscard]] inline std::vector<ReferencePoint>
layered_reference_points(std::size_t num_objectives, std::span<const ReferenceLayer> layers) {
    if (layers.empty()) {
        throw std::invalid_argument("Layered reference points need at least one layer");
    }

    std::vector<ReferencePoint> points;
    for (const auto& layer : layers) {
        auto layer_points = uniform_reference_points(num_objectives, layer.divisions, layer.scaling);
        points.insert(points.end(), std::make_move_iterator(layer_points.begin()),
                      std::make_move_iterator(layer_points.end()));
    }
    return points;
}

} // namespace paretolab::niching
