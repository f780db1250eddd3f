#pragma once

// =============================================================================
// FILE: dcv/binding/c_api/internal.hpp
// BRIEF: Exception barrier and buffer helpers shared by the C API sources
// =============================================================================
//
// Not part of the public interface.

#include "dcv/binding/c_api/core.h"
#include "dcv/core/error.hpp"
#include "dcv/core/matrix.hpp"
#include "dcv/core/type.hpp"

#include <string>
#include <string_view>
#include <type_traits>

namespace dcv::binding {

static_assert(std::is_same_v<dcv_real_t, Real>, "dcv_real_t must match dcv::Real");
static_assert(std::is_same_v<dcv_index_t, Index>, "dcv_index_t must match dcv::Index");

// =============================================================================
// Thread-Local Error State
// =============================================================================

void set_last_error(dcv_error_t code, std::string_view message) noexcept;

void clear_last_error() noexcept;

[[nodiscard]] auto get_last_error_message() noexcept -> const char*;

[[nodiscard]] auto get_last_error_code() noexcept -> dcv_error_t;

/// @brief Map the active exception to an error code and record its message.
/// Must be called from inside a catch block.
[[nodiscard]] auto handle_exception() noexcept -> dcv_error_t;

// =============================================================================
// Buffer Conversion
// =============================================================================

/// @brief Copy a column-major buffer into an owned matrix.
inline Mat copy_matrix(const dcv_real_t* data, dcv_index_t rows, dcv_index_t cols, const char* name) {
    DCV_CHECK_ARG(rows >= 0 && cols >= 0, std::string(name) + ": negative dimension");
    if (rows * cols > 0) {
        DCV_CHECK_NULL(data, std::string(name) + " is null");
    }
    Mat out(rows, cols);
    if (rows * cols > 0) {
        out = Eigen::Map<const Mat>(data, rows, cols);
    }
    return out;
}

inline void write_matrix(const Mat& m, dcv_real_t* out) {
    Eigen::Map<Mat>(out, m.rows(), m.cols()) = m;
}

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define DCV_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (DCV_UNLIKELY((ptr) == nullptr)) { \
            dcv::binding::set_last_error(DCV_ERROR_NULL_POINTER, (msg)); \
            return DCV_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define DCV_C_API_TRY try {

#define DCV_C_API_CATCH \
    } catch (...) { \
        return dcv::binding::handle_exception(); \
    }

#define DCV_C_API_RETURN_OK \
    do { \
        dcv::binding::clear_last_error(); \
        return DCV_OK; \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace dcv::binding
