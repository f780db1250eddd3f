#pragma once

#include "dcv/core/type.hpp"

#include <type_traits>

// HWY_COMPILE_ONLY_SCALAR is set in config.hpp when DCV_ONLY_SCALAR is on
#define HWY_DISABLED_TARGETS_LOG
#include <hwy/highway.h>

// =============================================================================
// FILE: dcv/core/simd.hpp
// BRIEF: Highway ops for the column reductions in metrics, refine, constraint
// =============================================================================

namespace dcv::simd {

using namespace hwy::HWY_NAMESPACE;

// Widest vector for T on the static target
template <typename T>
using SimdTagFor = ScalableTag<std::remove_const_t<T>>;

} // namespace dcv::simd
