#pragma once

/// @file console_logger.hpp
/// @brief Minimal stderr sink registered as the default kcenon logger by lootbox_sim.

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace lbx::app {

class ConsoleLogger final : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    explicit ConsoleLogger(log_level minLevel = log_level::info) : minLevel_(minLevel) {}

    kcenon::common::VoidResult log(log_level level, const std::string& message) override;

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override;

    log_level get_level() const override { return minLevel_.load(std::memory_order_acquire); }

    kcenon::common::VoidResult flush() override;

private:
    std::atomic<log_level> minLevel_;
    std::mutex mutex_;
};

} // namespace lbx::app
