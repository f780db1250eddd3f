#pragma once

#include "dcv/config.hpp"
#include <cstdint>

// =============================================================================
// FILE: dcv/core/macros.hpp
// BRIEF: Compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define DCV_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define DCV_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define DCV_LIKELY(x)   (x)
    #define DCV_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define DCV_FORCE_INLINE __forceinline
    #define DCV_EXPORT __declspec(dllexport)
#else
    #define DCV_FORCE_INLINE inline __attribute__((always_inline))
    #define DCV_EXPORT __attribute__((visibility("default")))
#endif
