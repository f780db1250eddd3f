#pragma once

#include "dcv/core/macros.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

// =============================================================================
// FILE: dcv/core/error.hpp
// BRIEF: Error codes, exception hierarchy and argument checks
//
//   Exception
//     ValueError            bad caller input, raised before any solve
//       DimensionError      feature axes or label vectors do not line up
//       DomainError         input outside what an algorithm accepts
//       RangeError          a scalar option outside its interval
//     NumericalError        a solve failed and no fallback was allowed
//       SingularMatrixError
//       ConvergenceError
//     RuntimeError
//       NullPointerError    C ABI only
//       InternalError       broken invariant
//
// Per-sample problems (zero target, fallback tiers) are never exceptions;
// they are reported through diagnostics.
// =============================================================================

namespace dcv {

// Values are part of the C ABI (dcv_error_t)
enum class ErrorCode : std::int32_t {
    OK = 0,

    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    DOMAIN_ERROR = 12,
    RANGE_ERROR = 13,

    NUMERICAL_ERROR = 50,
    SINGULAR_MATRIX = 51,
    CONVERGENCE_ERROR = 54,
};

inline auto error_code_name(ErrorCode code) noexcept -> const char* {
    switch (code) {
        case ErrorCode::OK:                 return "ok";
        case ErrorCode::UNKNOWN:            return "unknown";
        case ErrorCode::INTERNAL_ERROR:     return "internal";
        case ErrorCode::OUT_OF_MEMORY:      return "out of memory";
        case ErrorCode::NULL_POINTER:       return "null pointer";
        case ErrorCode::INVALID_ARGUMENT:   return "invalid argument";
        case ErrorCode::DIMENSION_MISMATCH: return "dimension mismatch";
        case ErrorCode::DOMAIN_ERROR:       return "domain";
        case ErrorCode::RANGE_ERROR:        return "range";
        case ErrorCode::NUMERICAL_ERROR:    return "numerical";
        case ErrorCode::SINGULAR_MATRIX:    return "singular matrix";
        case ErrorCode::CONVERGENCE_ERROR:  return "convergence";
    }
    return "unknown";
}

class DCV_EXPORT Exception : public std::exception {
public:
    Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override { return msg_.c_str(); }
    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> const std::string& { return msg_; }

private:
    ErrorCode code_;
    std::string msg_;
};

// =============================================================================
// Input Errors
// =============================================================================

class ValueError : public Exception {
public:
    explicit ValueError(std::string msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, std::move(msg)) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

// Reference and mixture disagree on the feature axis, or a label vector does
// not fit its matrix. Always fatal for the call.
class DimensionError : public ValueError {
public:
    explicit DimensionError(std::string msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, std::move(msg)) {}
};

// e.g. negative expression values handed to the joint factorization
class DomainError : public ValueError {
public:
    explicit DomainError(std::string msg)
        : ValueError(ErrorCode::DOMAIN_ERROR, std::move(msg)) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(std::string msg)
        : ValueError(ErrorCode::RANGE_ERROR, std::move(msg)) {}
};

// =============================================================================
// Solver Errors
//
// Only raised when the caller disabled the fallback chain, or when even the
// last tier could not produce coefficients.
// =============================================================================

class NumericalError : public Exception {
public:
    explicit NumericalError(std::string msg)
        : Exception(ErrorCode::NUMERICAL_ERROR, std::move(msg)) {}

protected:
    NumericalError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class SingularMatrixError : public NumericalError {
public:
    explicit SingularMatrixError(std::string msg)
        : NumericalError(ErrorCode::SINGULAR_MATRIX, std::move(msg)) {}
};

class ConvergenceError : public NumericalError {
public:
    explicit ConvergenceError(std::string msg)
        : NumericalError(ErrorCode::CONVERGENCE_ERROR, std::move(msg)) {}
};

// =============================================================================
// Runtime Errors
// =============================================================================

class RuntimeError : public Exception {
public:
    RuntimeError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class NullPointerError : public RuntimeError {
public:
    explicit NullPointerError(std::string msg)
        : RuntimeError(ErrorCode::NULL_POINTER, std::move(msg)) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "internal dcv error: " + msg) {}
};

// =============================================================================
// Checks
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define DCV_CHECK_INVARIANT(condition, msg) \
    do { \
        if (DCV_UNLIKELY(!(condition))) { \
            throw dcv::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

#define DCV_CHECK_ARG(condition, msg) \
    do { \
        if (DCV_UNLIKELY(!(condition))) { \
            throw dcv::ValueError(msg); \
        } \
    } while(0)

#define DCV_CHECK_DIM(condition, msg) \
    do { \
        if (DCV_UNLIKELY(!(condition))) { \
            throw dcv::DimensionError(msg); \
        } \
    } while(0)

#define DCV_CHECK_NULL(ptr, msg) \
    do { \
        if (DCV_UNLIKELY((ptr) == nullptr)) { \
            throw dcv::NullPointerError(msg); \
        } \
    } while(0)

// A fraction in [0, 1); NaN fails the check
#define DCV_CHECK_FRACTION(value, where) \
    do { \
        if (DCV_UNLIKELY(!((value) >= 0 && (value) < 1))) { \
            throw dcv::RangeError(std::string(where) + ": min_fraction must be in [0, 1)"); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace dcv
