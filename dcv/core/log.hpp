#pragma once

#include "dcv/config.hpp"
#include "dcv/core/macros.hpp"
#include <functional>
#include <sstream>
#include <string>
#include <string_view>

// =============================================================================
// FILE: dcv/core/log.hpp
// BRIEF: Leveled, timestamped diagnostics on stderr with a replaceable sink
// =============================================================================
//
// Every fallback, skipped sample and heuristic label match goes through here,
// so callers can either read stderr or capture the records with set_sink().
//
// Output format:
//   [2026-10-19 14:03:55] [Warning] sample 'S3': all-zero mixture, skipped

namespace dcv::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

using Sink = std::function<void(Level, const std::string&)>;

/// @brief Current threshold; records below it are dropped.
/// On first call the threshold is read from DCV_LOG_LEVEL when set.
DCV_EXPORT Level level() noexcept;

DCV_EXPORT void set_level(Level lvl) noexcept;

/// @brief Route records to a custom sink instead of stderr. The sink runs
/// outside the sink lock, so it may log or call set_sink itself.
DCV_EXPORT void set_sink(Sink sink);

DCV_EXPORT void reset_sink();

/// @brief Emit one record. Serialized across threads.
DCV_EXPORT void write(Level lvl, const std::string& msg);

DCV_EXPORT auto level_name(Level lvl) noexcept -> const char*;

/// @brief Parse "debug", "info", "warning"/"warn", "error", "off" (case-insensitive).
DCV_EXPORT bool parse_level(std::string_view text, Level& out);

DCV_EXPORT auto curr_time() -> std::string;

} // namespace dcv::log

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define DCV_LOG(lvl, msg) \
    do { \
        if (static_cast<int>(lvl) >= static_cast<int>(dcv::log::level())) { \
            std::ostringstream dcv_log_oss_; \
            dcv_log_oss_ << msg; \
            dcv::log::write((lvl), dcv_log_oss_.str()); \
        } \
    } while(0)

#define DCV_LOG_DEBUG(msg) DCV_LOG(dcv::log::Level::Debug, msg)
#define DCV_LOG_INFO(msg)  DCV_LOG(dcv::log::Level::Info, msg)
#define DCV_LOG_WARN(msg)  DCV_LOG(dcv::log::Level::Warning, msg)
#define DCV_LOG_ERROR(msg) DCV_LOG(dcv::log::Level::Error, msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
