// =============================================================================
// FILE: dcv/binding/c_api/core.cpp
// BRIEF: Thread-local error state, exception mapping and runtime controls
// =============================================================================

#include "dcv/binding/c_api/core.h"
#include "dcv/binding/c_api/internal.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/log.hpp"
#include "dcv/threading/scheduler.hpp"
#include "dcv/version.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>

namespace dcv::binding {

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local dcv_error_t g_last_error_code = DCV_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

void set_last_error(dcv_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = DCV_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (DCV_LIKELY(g_last_error_message[0] != '\0')) {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> dcv_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

// dcv exceptions carry their own code, so the hierarchy needs no per-class
// catch blocks here
auto handle_exception() noexcept -> dcv_error_t {
    try {
        throw;
    }
    catch (const Exception& e) {
        const auto code = static_cast<dcv_error_t>(e.code());
        set_last_error(code, e.what());
        return code;
    }
    catch (const std::bad_alloc&) {
        set_last_error(DCV_ERROR_OUT_OF_MEMORY, "Memory allocation failed (std::bad_alloc)");
        return DCV_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::invalid_argument& e) {
        set_last_error(DCV_ERROR_INVALID_ARGUMENT, e.what());
        return DCV_ERROR_INVALID_ARGUMENT;
    }
    catch (const std::out_of_range& e) {
        set_last_error(DCV_ERROR_RANGE_ERROR, e.what());
        return DCV_ERROR_RANGE_ERROR;
    }
    catch (const std::exception& e) {
        set_last_error(DCV_ERROR_UNKNOWN, e.what());
        return DCV_ERROR_UNKNOWN;
    }
    catch (...) {
        set_last_error(DCV_ERROR_UNKNOWN, "Unknown non-standard exception");
        return DCV_ERROR_UNKNOWN;
    }
}

} // namespace dcv::binding

// =============================================================================
// C ABI Exports
// =============================================================================

extern "C" {

DCV_C_EXPORT const char* dcv_get_last_error(void) {
    return dcv::binding::get_last_error_message();
}

DCV_C_EXPORT dcv_error_t dcv_get_last_error_code(void) {
    return dcv::binding::get_last_error_code();
}

DCV_C_EXPORT void dcv_clear_error(void) {
    dcv::binding::clear_last_error();
}

DCV_C_EXPORT const char* dcv_get_version(void) {
    return DCV_VERSION_STRING;
}

DCV_C_EXPORT const char* dcv_get_build_config(void) {
    static const std::string config_str =
        std::string(DCV_REAL_TYPE_NAME) + "+" + dcv::threading::Scheduler::backend_name();
    return config_str.c_str();
}

DCV_C_EXPORT dcv_error_t dcv_set_log_level(int level) {
    if (level < static_cast<int>(dcv::log::Level::Debug) ||
        level > static_cast<int>(dcv::log::Level::Off)) {
        dcv::binding::set_last_error(DCV_ERROR_RANGE_ERROR, "log level must be in [0, 4]");
        return DCV_ERROR_RANGE_ERROR;
    }
    dcv::log::set_level(static_cast<dcv::log::Level>(level));
    DCV_C_API_RETURN_OK;
}

DCV_C_EXPORT int dcv_get_log_level(void) {
    return static_cast<int>(dcv::log::level());
}

DCV_C_EXPORT dcv_error_t dcv_set_num_threads(dcv_size_t n) {
    DCV_C_API_TRY
        dcv::threading::Scheduler::set_num_threads(n);
        DCV_C_API_RETURN_OK;
    DCV_C_API_CATCH
}

DCV_C_EXPORT dcv_size_t dcv_get_num_threads(void) {
    return dcv::threading::Scheduler::get_num_threads();
}

} // extern "C"
