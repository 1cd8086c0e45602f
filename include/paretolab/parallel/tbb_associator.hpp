#pragma once

#ifdef PARETOLAB_HAVE_TBB

#include <cstddef>
#include <span>
#include <vector>

#include <paretolab/core/concepts.hpp>
#include <paretolab/niching/association.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>

namespace paretolab::parallel {

/// Parallel niche association using Intel TBB
///
/// Rows of the N×R distance computation are independent, so each individual is associated
/// by the same NicheAssociator::nearest call the sequential path uses. Results are written
/// to distinct indices and are bit-identical to niching::associate_to_niches regardless of
/// thread count or scheduling.
///
/// static_partitioner fixes chunk boundaries; `grain_size` bounds the smallest chunk.
class TBBAssociator {
  public:
    explicit TBBAssociator(std::size_t grain_size = 64) : grain_size_(grain_size ? grain_size : 1) {}

    [[nodiscard]] std::size_t grain_size() const noexcept { return grain_size_; }

    /// Associate every listed position with its nearest reference direction
    ///
    /// @throws std::invalid_argument for zero-norm references
    /// @throws core::DimensionMismatchError for inconsistent dimensions. Records are checked
    ///         before the parallel section starts.
    [[nodiscard]] niching::Association
    associate(std::span<const core::FitnessRecord> fitnesses,
              std::span<const std::size_t> positions,
              std::span<const niching::ReferencePoint> references, std::span<const double> ideal,
              std::span<const double> intercepts) const {
        const niching::NicheAssociator associator(references);
        associator.check_normalization(ideal, intercepts);
        for (const auto position : positions) {
            associator.check_record(fitnesses[position], position);
        }

        niching::Association result;
        if (positions.empty()) {
            return result;
        }
        result.niches.resize(positions.size());
        result.distances.resize(positions.size());

        const std::size_t m = associator.num_objectives();
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, positions.size(), grain_size_),
            [&](const tbb::blocked_range<std::size_t>& range) {
                std::vector<double> scratch(m);
                for (std::size_t i = range.begin(); i != range.end(); ++i) {
                    const auto [niche, distance] = associator.nearest(
                        fitnesses[positions[i]].objectives, ideal, intercepts, scratch);
                    result.niches[i] = niche;
                    result.distances[i] = distance;
                }
            },
            tbb::static_partitioner{});

        return result;
    }

  private:
    std::size_t grain_size_;
};

} // namespace paretolab::parallel

#else

#error "\n" \
       "====================================================================\n" \
       " TBB (Threading Building Blocks) is required for parallel niche\n" \
       " association but was not found during configuration.\n" \
       "\n" \
       " Resolution options:\n" \
       "   1. Install the oneTBB development package:\n" \
       "      - Ubuntu/Debian: apt install libtbb-dev\n" \
       "      - RHEL/CentOS:   yum install tbb-devel\n" \
       "      - macOS:         brew install tbb\n" \
       "\n" \
       "   2. Disable parallel association:\n" \
       "      cmake -DPARETOLAB_USE_TBB=OFF .\n" \
       "===================================================================="

#endif // PARETOLAB_HAVE_TBB
