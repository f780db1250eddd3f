#pragma once

#include "dcv/config.hpp"
#include "dcv/core/macros.hpp"
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <type_traits>

// =============================================================================
// FILE: dcv/core/type.hpp
// BRIEF: Scalar types and the non-owning Array view used by SIMD kernels
// =============================================================================

namespace dcv {

#if defined(DCV_USE_FLOAT32)
    using Real = float;
#elif defined(DCV_USE_FLOAT64)
    using Real = double;
#else
    #error "DCV: No precision macro defined."
#endif

// Same width as Eigen::Index on LP64, so matrix extents never need a cast
using Index = std::int64_t;
using Size = std::size_t;

// =============================================================================
// Array View
//
// Pointer + length over one contiguous column (an Eigen column segment, a
// std::vector). Array<const T> is implicitly built from Array<T>.
// =============================================================================

template <typename T>
struct Array {
    using value_type = T;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size s) noexcept : ptr(p), len(s) {}

    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    DCV_FORCE_INLINE constexpr auto operator[](Size i) const noexcept -> T& {
        assert(i < len && "Array index out of bounds");
        return ptr[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return len == 0; }
    [[nodiscard]] constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] constexpr auto end() const noexcept -> T* {
        return ptr + len;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
};

static_assert(std::is_trivially_copyable_v<Array<const Real>>);

} // namespace dcv
