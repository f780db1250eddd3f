#include "dcv/core/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>

namespace dcv::log {

namespace {

// Guards the installed sink object
std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

// Serializes emission. Recursive so a sink may itself log on its thread.
std::recursive_mutex& emit_mutex() {
    static std::recursive_mutex m;
    return m;
}

Sink& custom_sink() {
    static Sink sink;
    return sink;
}

auto initial_level() -> int {
    const char* env = std::getenv(config::LEVEL_ENV_VAR);
    Level parsed = static_cast<Level>(config::DEFAULT_LEVEL);
    if (env != nullptr && !parse_level(env, parsed)) {
        std::cerr << "[" << curr_time() << "] [Warning] ignoring unrecognized "
                  << config::LEVEL_ENV_VAR << "='" << env << "'" << std::endl;
        parsed = static_cast<Level>(config::DEFAULT_LEVEL);
    }
    return static_cast<int>(parsed);
}

std::atomic<int>& threshold() {
    static std::atomic<int> value{initial_level()};
    return value;
}

} // namespace

Level level() noexcept {
    return static_cast<Level>(threshold().load(std::memory_order_relaxed));
}

void set_level(Level lvl) noexcept {
    threshold().store(static_cast<int>(lvl), std::memory_order_relaxed);
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    custom_sink() = std::move(sink);
}

void reset_sink() {
    std::lock_guard<std::mutex> lock(sink_mutex());
    custom_sink() = nullptr;
}

auto level_name(Level lvl) noexcept -> const char* {
    switch (lvl) {
        case Level::Debug:   return "Debug";
        case Level::Info:    return "Info";
        case Level::Warning: return "Warning";
        case Level::Error:   return "Error";
        case Level::Off:     return "Off";
    }
    return "Unknown";
}

bool parse_level(std::string_view text, Level& out) {
    std::string key(text.size(), '\0');
    std::transform(text.begin(), text.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "debug") { out = Level::Debug; return true; }
    if (key == "info") { out = Level::Info; return true; }
    if (key == "warning" || key == "warn") { out = Level::Warning; return true; }
    if (key == "error") { out = Level::Error; return true; }
    if (key == "off" || key == "none") { out = Level::Off; return true; }
    return false;
}

auto curr_time() -> std::string {
    std::time_t rawtime = std::time(nullptr);
    std::tm timeinfo{};
    localtime_r(&rawtime, &timeinfo);
    char buff[32];
    std::strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &timeinfo);
    return std::string(buff);
}

void write(Level lvl, const std::string& msg) {
    if (lvl == Level::Off) {
        return;
    }
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        sink = custom_sink();
    }

    std::lock_guard<std::recursive_mutex> lock(emit_mutex());
    if (sink) {
        sink(lvl, msg);
        return;
    }
    std::cerr << "[" << curr_time() << "] [" << level_name(lvl) << "] " << msg << std::endl;
}

} // namespace dcv::log
