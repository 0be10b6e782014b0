/// @file console_logger.cpp
/// @brief ConsoleLogger implementation.

#include "console_logger.hpp"

#include <iostream>

namespace lbx::app {

namespace {

const char* levelTag(kcenon::common::interfaces::log_level level) {
    using kcenon::common::interfaces::log_level;
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO ";
        case log_level::warning:  return "WARN ";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRIT ";
        default:                  return "     ";
    }
}

} // namespace

kcenon::common::VoidResult ConsoleLogger::log(log_level level, const std::string& message) {
    if (is_enabled(level)) {
        std::lock_guard lock(mutex_);
        std::cerr << levelTag(level) << ' ' << message << '\n';
    }
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(
    log_level level, std::string_view message,
    const kcenon::common::interfaces::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(
    const kcenon::common::interfaces::log_entry& entry) {
    return log(entry.level, entry.message);
}

kcenon::common::VoidResult ConsoleLogger::set_level(log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    std::cerr.flush();
    return kcenon::common::VoidResult::ok(std::monostate{});
}

} // namespace lbx::app
