#pragma once

/// @file niching.hpp
/// @brief Least-used-niche selection for the last, partially accepted front

#include <algorithm>
#include <cstddef>
#include <limits>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace paretolab::niching {

/// Number of entries of `niches` pointing at each of `num_references` niches
///
/// @throws std::invalid_argument if a niche index is out of range
[[nodiscard]] inline std::vector<std::size_t> count_niches(std::span<const std::size_t> niches,
                                                           std::size_t num_references) {
    std::vector<std::size_t> counts(num_references, 0);
    for (const auto niche : niches) {
        if (niche >= num_references) {
            throw std::invalid_argument("Niche index " + std::to_string(niche) +
                                        " out of range for " + std::to_string(num_references) +
                                        " reference points");
        }
        ++counts[niche];
    }
    return counts;
}

/// Pick `k` members of the last front, favouring the least crowded niches
///
/// Each round takes the niches that still have available members, keeps those with the
/// minimum count, shuffles them and visits at most as many as slots remain. A visited niche
/// with count 0 gives up its member closest to the reference direction (lowest index on
/// ties); any other niche gives up a uniformly random member. `niche_counts` is incremented
/// for every pick, so the caller sees the updated table.
///
/// @param niches Niche of each last-front member
/// @param distances Perpendicular distance of each last-front member to its niche
/// @param k Number of members to pick; clamped to the number of members
/// @param niche_counts Occupancy per reference point, updated in place
/// @param rng Source of every random choice
/// @return Indices into `niches`, in pick order, without repetition
/// @throws std::invalid_argument on mismatched lengths or a niche index out of range
template <std::uniform_random_bit_generator Rng>
[[nodiscard]] std::vector<std::size_t> select_by_niching(std::span<const std::size_t> niches,
                                                         std::span<const double> distances,
                                                         std::size_t k,
                                                         std::span<std::size_t> niche_counts,
                                                         Rng& rng) {
    if (niches.size() != distances.size()) {
        throw std::invalid_argument("Niching got " + std::to_string(niches.size()) +
                                    " niches but " + std::to_string(distances.size()) +
                                    " distances");
    }

    // Available members per niche, in index order
    std::vector<std::vector<std::size_t>> members(niche_counts.size());
    for (std::size_t i = 0; i < niches.size(); ++i) {
        if (niches[i] >= niche_counts.size()) {
            throw std::invalid_argument("Niche index " + std::to_string(niches[i]) +
                                        " out of range for " +
                                        std::to_string(niche_counts.size()) + " reference points");
        }
        members[niches[i]].push_back(i);
    }

    const std::size_t target = std::min(k, niches.size());
    std::vector<std::size_t> selected;
    selected.reserve(target);

    std::vector<std::size_t> candidates;
    while (selected.size() < target) {
        const std::size_t slots = target - selected.size();

        std::size_t min_count = std::numeric_limits<std::size_t>::max();
        for (std::size_t niche = 0; niche < members.size(); ++niche) {
            if (!members[niche].empty()) {
                min_count = std::min(min_count, niche_counts[niche]);
            }
        }

        candidates.clear();
        for (std::size_t niche = 0; niche < members.size(); ++niche) {
            if (!members[niche].empty() && niche_counts[niche] == min_count) {
                candidates.push_back(niche);
            }
        }
        std::shuffle(candidates.begin(), candidates.end(), rng);
        if (candidates.size() > slots) {
            candidates.resize(slots);
        }

        for (const auto niche : candidates) {
            auto& available = members[niche];

            std::size_t pick = 0;
            if (niche_counts[niche] == 0) {
                for (std::size_t j = 1; j < available.size(); ++j) {
                    if (distances[available[j]] < distances[available[pick]]) {
                        pick = j;
                    }
                }
            } else {
                std::uniform_int_distribution<std::size_t> dist(0, available.size() - 1);
                pick = dist(rng);
            }

            selected.push_back(available[pick]);
            available.erase(available.begin() + static_cast<std::ptrdiff_t>(pick));
            ++niche_counts[niche];
        }
    }
    return selected;
}

} // namespace paretolab::niching
