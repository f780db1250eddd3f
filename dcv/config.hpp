#pragma once

// =============================================================================
// FILE: dcv/config.hpp
// BRIEF: Build-time switches: precision, threading backend, SIMD, logging
//
// Normally set by CMake (DCV_PRECISION, DCV_BACKEND_*); the defaults below
// apply when the headers are used without the build system.
// =============================================================================

// =============================================================================
// Precision
//   0: float32
//   1: float64 (default, the solvers work on Gram matrices whose condition
//      number is the square of the reference's)
// =============================================================================

#ifndef DCV_PRECISION
    #define DCV_PRECISION 1
#endif

#if DCV_PRECISION == 0
    #define DCV_USE_FLOAT32
#elif DCV_PRECISION == 1
    #define DCV_USE_FLOAT64
#else
    #error "DCV Configuration Error: DCV_PRECISION must be 0 (f32) or 1 (f64)."
#endif

// =============================================================================
// Platform
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define DCV_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define DCV_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define DCV_OS_LINUX
#endif

// =============================================================================
// Threading Backend
//
// Exactly one of DCV_BACKEND_{SERIAL,OPENMP,TBB,BS}. Without a choice,
// OpenMP on Linux and Windows, BS::thread_pool elsewhere (Apple clang ships
// no OpenMP runtime).
// =============================================================================

#if defined(DCV_BACKEND_SERIAL) + defined(DCV_BACKEND_OPENMP) + \
    defined(DCV_BACKEND_TBB) + defined(DCV_BACKEND_BS) > 1
    #error "DCV Configuration Error: more than one DCV_BACKEND_* defined."
#endif

#if !defined(DCV_BACKEND_SERIAL) && !defined(DCV_BACKEND_OPENMP) && \
    !defined(DCV_BACKEND_TBB) && !defined(DCV_BACKEND_BS)
    #if defined(DCV_OS_LINUX) || defined(DCV_OS_WINDOWS)
        #define DCV_BACKEND_OPENMP
    #else
        #define DCV_BACKEND_BS
    #endif
#endif

#if defined(DCV_BACKEND_OPENMP)
    #define DCV_USE_OPENMP 1
#elif defined(DCV_BACKEND_TBB)
    #define DCV_USE_TBB 1
#elif defined(DCV_BACKEND_BS)
    #define DCV_USE_BS 1
#else
    #define DCV_USE_SERIAL 1
#endif

// =============================================================================
// SIMD
// =============================================================================

// Restrict Highway to its portable scalar target (debugging, valgrind)
#if defined(DCV_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

// =============================================================================
// Logging
// =============================================================================

namespace dcv::log::config {
    // Read once, on first use of the logger
    inline constexpr const char* LEVEL_ENV_VAR = "DCV_LOG_LEVEL";
    // 0 debug, 1 info, 2 warning, 3 error, 4 off
    inline constexpr int DEFAULT_LEVEL = 2;
}
