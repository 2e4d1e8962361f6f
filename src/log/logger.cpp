#include "rpcbridge/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace rpcbridge {

LogLevel log_level_from_string(std::string_view name) noexcept {
    const auto is = [name](std::string_view candidate) {
        return std::ranges::equal(name, candidate, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        });
    };

    if (is("trace")) return LogLevel::Trace;
    if (is("debug")) return LogLevel::Debug;
    if (is("info"))  return LogLevel::Info;
    if (is("warn") || is("warning")) return LogLevel::Warn;
    if (is("error")) return LogLevel::Error;
    if (is("fatal")) return LogLevel::Fatal;
    if (is("off"))   return LogLevel::Off;
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger != nullptr) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace rpcbridge
