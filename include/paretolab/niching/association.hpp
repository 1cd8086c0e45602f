#pragma once

/// @file association.hpp
/// @brief Perpendicular-distance association of individuals to reference directions

#include <cmath>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <paretolab/core/concepts.hpp>
#include <paretolab/niching/reference_points.hpp>

namespace paretolab::niching {

/// Niche index and perpendicular distance of every associated individual, in input order
struct Association {
    std::vector<std::size_t> niches;
    std::vector<double> distances;
};

/// Nearest reference direction of normalized objective vectors
///
/// Reference directions are lines through the origin; the distance of a point to one is
/// the Euclidean distance between the point and its projection on the line.
class NicheAssociator {
  private:
    std::span<const ReferencePoint> references_;
    std::vector<double> norms_;

  public:
    /// @throws std::invalid_argument if there are no references or one has zero norm
    /// @throws core::DimensionMismatchError if the references differ in dimension
    explicit NicheAssociator(std::span<const ReferencePoint> references)
        : references_(references) {
        if (references_.empty()) {
            throw std::invalid_argument("Niche association needs at least one reference point");
        }
        norms_.reserve(references_.size());
        const std::size_t m = references_.front().size();
        for (std::size_t r = 0; r < references_.size(); ++r) {
            const auto& reference = references_[r];
            if (reference.size() != m) {
                throw core::DimensionMismatchError("Reference point " + std::to_string(r) +
                                                   " has " + std::to_string(reference.size()) +
                                                   " coordinates, expected " + std::to_string(m));
            }
            double squared = 0.0;
            for (const auto coord : reference) {
                squared += coord * coord;
            }
            const double norm = std::sqrt(squared);
            if (!(norm > 0.0)) {
                throw std::invalid_argument("Reference point " + std::to_string(r) +
                                            " has zero norm");
            }
            norms_.push_back(norm);
        }
    }

    [[nodiscard]] std::size_t num_objectives() const noexcept {
        return references_.front().size();
    }

    [[nodiscard]] std::size_t size() const noexcept { return references_.size(); }

    /// Nearest reference of one raw objective vector
    ///
    /// The vector is normalized as `(f - ideal) / intercepts`. Ties go to the lowest index.
    ///
    /// @param scratch Buffer of at least M doubles reused across calls
    /// @return (niche index, perpendicular distance)
    [[nodiscard]] std::pair<std::size_t, double> nearest(std::span<const double> objectives,
                                                         std::span<const double> ideal,
                                                         std::span<const double> intercepts,
                                                         std::span<double> scratch) const {
        const std::size_t m = num_objectives();
        for (std::size_t i = 0; i < m; ++i) {
            scratch[i] = (objectives[i] - ideal[i]) / intercepts[i];
        }

        std::size_t best = 0;
        double best_distance = std::numeric_limits<double>::infinity();
        for (std::size_t r = 0; r < references_.size(); ++r) {
            const auto& reference = references_[r];
            const double norm = norms_[r];

            double projection = 0.0;
            for (std::size_t i = 0; i < m; ++i) {
                projection += scratch[i] * reference[i];
            }
            projection /= norm;

            double squared = 0.0;
            for (std::size_t i = 0; i < m; ++i) {
                const double diff = projection * reference[i] / norm - scratch[i];
                squared += diff * diff;
            }
            const double distance = std::sqrt(squared);
            if (distance < best_distance) {
                best_distance = distance;
                best = r;
            }
        }
        return {best, best_distance};
    }

    /// Check that the normalization points match the reference dimension
    void check_normalization(std::span<const double> ideal,
                             std::span<const double> intercepts) const {
        const std::size_t m = num_objectives();
        if (ideal.size() != m || intercepts.size() != m) {
            throw core::DimensionMismatchError(
                "Normalization points have " + std::to_string(ideal.size()) + " and " +
                std::to_string(intercepts.size()) + " objectives, expected " + std::to_string(m));
        }
    }

    /// Check that an objective vector matches the reference dimension
    void check_record(const core::FitnessRecord& fitness, std::size_t position) const {
        if (fitness.objectives.size() != num_objectives()) {
            throw core::DimensionMismatchError(
                "Fitness record " + std::to_string(position) + " has " +
                std::to_string(fitness.objectives.size()) + " objectives, expected " +
                std::to_string(num_objectives()));
        }
    }
};

/// Associate every listed position with its nearest reference direction
///
/// @param intercepts Per-axis offsets from the ideal point, as returned by find_intercepts
/// @throws std::invalid_argument for zero-norm references
/// @throws core::DimensionMismatchError for inconsistent dimensions
[[nodiscard]] inline Association associate_to_niches(std::span<const core::FitnessRecord> fitnesses,
                                                      std::span<const std::size_t> positions,
                                                      std::span<const ReferencePoint> references,
                                                      std::span<const double> ideal,
                                                      std::span<const double> intercepts) {
    const NicheAssociator associator(references);
    associator.check_normalization(ideal, intercepts);

    Association result;
    result.niches.reserve(positions.size());
    result.distances.reserve(positions.size());

    std::vector<double> scratch(associator.num_objectives());
    for (const auto position : positions) {
        associator.check_record(fitnesses[position], position);
        const auto [niche, distance] =
            associator.nearest(fitnesses[position].objectives, ideal, intercepts, scratch);
        result.niches.push_back(niche);
        result.distances.push_back(distance);
    }
    return result;
}

} // namespace paretolab::niching
