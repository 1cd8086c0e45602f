#pragma once

/// @file compiler_hints.hpp
/// @brief Branch and inlining hints for the dominance loops of the sorters
///
/// The hints only affect code layout, never results.

#if defined(__GNUC__) || defined(__clang__)
#define PARETOLAB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define PARETOLAB_FORCE_INLINE __attribute__((always_inline)) inline
#elif defined(_MSC_VER)
#define PARETOLAB_UNLIKELY(x) (x)
#define PARETOLAB_FORCE_INLINE __forceinline
#else
#define PARETOLAB_UNLIKELY(x) (x)
#define PARETOLAB_FORCE_INLINE inline
#endif
