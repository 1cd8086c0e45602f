#pragma once

/// @file normalization.hpp
/// @brief Ideal point, extreme points and hyperplane intercepts for NSGA-III
///
/// All points live in objective space and are minimized. Intercepts are reported as offsets
/// from the ideal point, so a normalized objective is `(f - ideal) / intercept`.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include <paretolab/core/concepts.hpp>

namespace paretolab::niching {

using core::FitnessRecord;

/// Point in objective space
using Point = std::vector<double>;

/// Smallest admissible intercept
inline constexpr double kInterceptFloor = 1e-6;

/// Weight of the off-axis objectives in the achievement scalarizing function
inline constexpr double kAsfOffAxisWeight = 1e6;

/// Branch of the fallback chain that produced the intercepts
enum class InterceptSource {
    hyperplane,    ///< Solution of the extreme-point hyperplane
    current_worst, ///< Hyperplane singular; worst point ever seen
    front_worst    ///< Hyperplane degenerate; worst point of the current fronts
};

[[nodiscard]] inline const char* to_string(InterceptSource source) noexcept {
    switch (source) {
    case InterceptSource::hyperplane:
        return "hyperplane";
    case InterceptSource::current_worst:
        return "current_worst";
    case InterceptSource::front_worst:
        return "front_worst";
    }
    return "unknown";
}

struct Intercepts {
    /// Per-axis distance from the ideal point, each greater than kInterceptFloor
    Point values;
    InterceptSource source = InterceptSource::hyperplane;
};

/// @private
namespace detail {

inline void check_length(std::span<const double> point, std::size_t m, const char* what) {
    if (point.size() != m) {
        throw core::DimensionMismatchError(std::string(what) + " has " +
                                           std::to_string(point.size()) +
                                           " objectives, expected " + std::to_string(m));
    }
}

template <typename Combine>
Point componentwise(std::span<const FitnessRecord> fitnesses,
                    std::span<const std::size_t> positions, Combine combine) {
    if (positions.empty()) {
        throw std::invalid_argument("Cannot reduce an empty set of positions to a point");
    }
    Point point = fitnesses[positions.front()].objectives;
    for (const auto position : positions.subspan(1)) {
        const auto& objectives = fitnesses[position].objectives;
        check_length(objectives, point.size(), "Fitness record");
        for (std::size_t i = 0; i < point.size(); ++i) {
            point[i] = combine(point[i], objectives[i]);
        }
    }
    return point;
}

} // namespace detail

/// Component-wise minimum of the given positions
///
/// @throws std::invalid_argument if `positions` is empty
[[nodiscard]] inline Point ideal_point(std::span<const FitnessRecord> fitnesses,
                                       std::span<const std::size_t> positions) {
    return detail::componentwise(fitnesses, positions,
                                 [](double a, double b) { return std::min(a, b); });
}

/// Component-wise maximum of the given positions
[[nodiscard]] inline Point worst_point(std::span<const FitnessRecord> fitnesses,
                                       std::span<const std::size_t> positions) {
    return detail::componentwise(fitnesses, positions,
                                 [](double a, double b) { return std::max(a, b); });
}

/// Extreme point of every objective axis
///
/// For axis j, the extreme point minimizes max_i w_ji * (f_i - ideal_i) with w_jj = 1 and
/// all other weights kAsfOffAxisWeight. Candidates are the given positions followed by the
/// previous generation's extreme points; the first minimizer wins.
///
/// @return M points, the j-th being the extreme point of axis j
[[nodiscard]] inline std::vector<Point>
find_extreme_points(std::span<const FitnessRecord> fitnesses,
                    std::span<const std::size_t> positions, std::span<const double> ideal,
                    std::span<const Point> previous_extremes = {}) {
    const std::size_t m = ideal.size();

    std::vector<std::span<const double>> candidates;
    candidates.reserve(positions.size() + previous_extremes.size());
    for (const auto position : positions) {
        detail::check_length(fitnesses[position].objectives, m, "Fitness record");
        candidates.emplace_back(fitnesses[position].objectives);
    }
    for (const auto& extreme : previous_extremes) {
        detail::check_length(extreme, m, "Previous extreme point");
        candidates.emplace_back(extreme);
    }
    if (candidates.empty()) {
        throw std::invalid_argument("Extreme points need at least one candidate");
    }

    std::vector<Point> extremes;
    extremes.reserve(m);
    for (std::size_t axis = 0; axis < m; ++axis) {
        double best_asf = std::numeric_limits<double>::infinity();
        std::size_t best = 0;
        for (std::size_t c = 0; c < candidates.size(); ++c) {
            double asf = -std::numeric_limits<double>::infinity();
            for (std::size_t i = 0; i < m; ++i) {
                const double weight = i == axis ? 1.0 : kAsfOffAxisWeight;
                asf = std::max(asf, weight * (candidates[c][i] - ideal[i]));
            }
            if (asf < best_asf) {
                best_asf = asf;
                best = c;
            }
        }
        extremes.emplace_back(candidates[best].begin(), candidates[best].end());
    }
    return extremes;
}

/// Axis intercepts of the hyperplane through the extreme points
///
/// Solves (extremes - ideal) x = 1 and returns 1 / x. The chain falls back to
/// `current_worst - ideal` when the system is singular, and to `front_worst - ideal` when a
/// component of x is zero, the residual check fails, an intercept is not above
/// kInterceptFloor, or an intercept lies beyond `current_worst`. Axes still not above the
/// floor after the fallback are set to 1.
///
/// Never throws for degenerate geometry; only mismatched dimensions are reported.
[[nodiscard]] inline Intercepts find_intercepts(std::span<const Point> extremes,
                                                std::span<const double> ideal,
                                                std::span<const double> current_worst,
                                                std::span<const double> front_worst) {
    const std::size_t m = ideal.size();
    if (extremes.size() != m) {
        throw core::DimensionMismatchError("Expected " + std::to_string(m) +
                                           " extreme points, got " +
                                           std::to_string(extremes.size()));
    }
    detail::check_length(current_worst, m, "Current worst point");
    detail::check_length(front_worst, m, "Front worst point");

    const auto dim = static_cast<Eigen::Index>(m);
    Eigen::MatrixXd a(dim, dim);
    for (Eigen::Index row = 0; row < dim; ++row) {
        const auto& extreme = extremes[static_cast<std::size_t>(row)];
        detail::check_length(extreme, m, "Extreme point");
        for (Eigen::Index col = 0; col < dim; ++col) {
            const auto c = static_cast<std::size_t>(col);
            a(row, col) = extreme[c] - ideal[c];
        }
    }
    const Eigen::VectorXd b = Eigen::VectorXd::Ones(dim);

    auto offsets_to = [&](std::span<const double> bound, InterceptSource source) {
        Intercepts result{Point(m), source};
        for (std::size_t i = 0; i < m; ++i) {
            result.values[i] = bound[i] - ideal[i];
        }
        return result;
    };

    Intercepts result;
    const Eigen::FullPivLU<Eigen::MatrixXd> lu(a);
    if (!lu.isInvertible()) {
        result = offsets_to(current_worst, InterceptSource::current_worst);
    } else {
        const Eigen::VectorXd x = lu.solve(b);
        if ((x.array() == 0.0).any() || !x.allFinite()) {
            result = offsets_to(front_worst, InterceptSource::front_worst);
        } else {
            const Eigen::VectorXd intercepts = x.cwiseInverse();
            const Eigen::ArrayXd residual = (a * x - b).array().abs();

            bool degenerate = (residual > 1e-8 + 1e-5).any();
            for (Eigen::Index i = 0; i < dim && !degenerate; ++i) {
                const auto axis = static_cast<std::size_t>(i);
                degenerate = intercepts(i) <= kInterceptFloor ||
                             intercepts(i) + ideal[axis] > current_worst[axis];
            }

            if (degenerate) {
                result = offsets_to(front_worst, InterceptSource::front_worst);
            } else {
                result.values.assign(intercepts.data(), intercepts.data() + m);
                result.source = InterceptSource::hyperplane;
            }
        }
    }

    // A front that is flat on an axis leaves a zero offset; use a unit scale instead
    for (auto& value : result.values) {
        if (!(value > kInterceptFloor)) {
            value = 1.0;
        }
    }
    return result;
}

/// Normalization state carried from one generation to the next
///
/// Tracks the best and worst objective values ever seen and the last extreme points, so the
/// hyperplane cannot regress when the current fronts lose their extreme members.
class NormalizationMemory {
  private:
    Point ideal_;
    Point worst_;
    std::vector<Point> extremes_;

  public:
    [[nodiscard]] bool empty() const noexcept { return ideal_.empty(); }

    [[nodiscard]] const Point& ideal() const noexcept { return ideal_; }
    [[nodiscard]] const Point& worst() const noexcept { return worst_; }
    [[nodiscard]] std::span<const Point> extremes() const noexcept { return extremes_; }

    /// Merge the current generation's points into the memory
    ///
    /// @throws core::DimensionMismatchError if the dimensionality changed between calls
    void update(std::span<const double> ideal, std::span<const double> worst,
                std::vector<Point> extremes) {
        if (empty()) {
            ideal_.assign(ideal.begin(), ideal.end());
            worst_.assign(worst.begin(), worst.end());
        } else {
            detail::check_length(ideal, ideal_.size(), "Ideal point");
            detail::check_length(worst, worst_.size(), "Worst point");
            for (std::size_t i = 0; i < ideal_.size(); ++i) {
                ideal_[i] = std::min(ideal_[i], ideal[i]);
                worst_[i] = std::max(worst_[i], worst[i]);
            }
        }
        extremes_ = std::move(extremes);
    }

    /// Ideal point of the current generation combined with the remembered one
    [[nodiscard]] Point merged_ideal(std::span<const double> current) const {
        Point merged(current.begin(), current.end());
        if (!empty()) {
            detail::check_length(current, ideal_.size(), "Ideal point");
            for (std::size_t i = 0; i < merged.size(); ++i) {
                merged[i] = std::min(merged[i], ideal_[i]);
            }
        }
        return merged;
    }

    /// Worst point of the current generation combined with the remembered one
    [[nodiscard]] Point merged_worst(std::span<const double> current) const {
        Point merged(current.begin(), current.end());
        if (!empty()) {
            detail::check_length(current, worst_.size(), "Worst point");
            for (std::size_t i = 0; i < merged.size(); ++i) {
                merged[i] = std::max(merged[i], worst_[i]);
            }
        }
        return merged;
    }

    void reset() noexcept {
        ideal_.clear();
        worst_.clear();
        extremes_.clear();
    }
};

} // namespace paretolab::niching
