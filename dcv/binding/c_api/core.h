#pragma once

// =============================================================================
// FILE: dcv/binding/c_api/core.h
// BRIEF: C ABI core types, error reporting and runtime controls
// =============================================================================
//
// ERROR PROTOCOL:
//   - Every fallible function returns a dcv_error_t (DCV_OK on success)
//   - The message of the last failure is kept per thread
//   - Outputs are left untouched when a call fails
//
// LAYOUT:
//   - Matrices cross the boundary as contiguous column-major buffers
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

#if defined(_MSC_VER)
    #define DCV_C_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define DCV_C_EXPORT __attribute__((visibility("default")))
#else
    #define DCV_C_EXPORT
#endif

// =============================================================================
// Basic Value Types (Must Match dcv::Real and dcv::Index)
// =============================================================================

#if defined(DCV_USE_FLOAT32) || (defined(DCV_PRECISION) && DCV_PRECISION == 0)
typedef float dcv_real_t;
#define DCV_REAL_TYPE_NAME "float32"
#else
typedef double dcv_real_t;
#define DCV_REAL_TYPE_NAME "float64"
#endif

typedef int64_t dcv_index_t;
typedef size_t dcv_size_t;

typedef int dcv_bool_t;
#define DCV_TRUE 1
#define DCV_FALSE 0

// =============================================================================
// Error Codes (stable, match dcv::ErrorCode)
// =============================================================================

typedef int32_t dcv_error_t;

#define DCV_OK 0

#define DCV_ERROR_UNKNOWN 1
#define DCV_ERROR_INTERNAL 2
#define DCV_ERROR_OUT_OF_MEMORY 3
#define DCV_ERROR_NULL_POINTER 4

#define DCV_ERROR_INVALID_ARGUMENT 10
#define DCV_ERROR_DIMENSION_MISMATCH 11
#define DCV_ERROR_DOMAIN_ERROR 12
#define DCV_ERROR_RANGE_ERROR 13

#define DCV_ERROR_NUMERICAL_ERROR 50
#define DCV_ERROR_SINGULAR_MATRIX 51
#define DCV_ERROR_CONVERGENCE_ERROR 54

// Message of the last failure on this thread, "No error" if none
DCV_C_EXPORT const char* dcv_get_last_error(void);

DCV_C_EXPORT dcv_error_t dcv_get_last_error_code(void);

DCV_C_EXPORT void dcv_clear_error(void);

// =============================================================================
// Runtime
// =============================================================================

// e.g. "0.3.1"
DCV_C_EXPORT const char* dcv_get_version(void);

// e.g. "float64+openmp"
DCV_C_EXPORT const char* dcv_get_build_config(void);

// Log levels: 0 debug, 1 info, 2 warning, 3 error, 4 off
DCV_C_EXPORT dcv_error_t dcv_set_log_level(int level);

DCV_C_EXPORT int dcv_get_log_level(void);

// Size of the worker pool used when a call requests 0 threads
DCV_C_EXPORT dcv_error_t dcv_set_num_threads(dcv_size_t n);

DCV_C_EXPORT dcv_size_t dcv_get_num_threads(void);

#ifdef __cplusplus
}
#endif
