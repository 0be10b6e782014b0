#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon logger registry for category-based
///        structured logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lbx/foundation/game_result.hpp"
#include "lbx/foundation/types.hpp"

namespace lbx::foundation {

/// Log severity levels.
///
/// Maps 1:1 onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per subsystem, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Host and framework lifecycle
    ECS         = 1, ///< Entities, storages, scheduler
    Plugin      = 2, ///< Plugin lifecycle
    Config      = 3, ///< Configuration loading and validation
    Loot        = 4, ///< Box generation, choice and opening
    Economy     = 5, ///< Equip / sell / currency
    Progression = 6  ///< Experience, levels, hall of fame
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Plugin", "Config", "Loot", "Economy", "Progression"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line as `key=value` pairs.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerId = PlayerId(7);
///   ctx.boxId = BoxId(12);
///   ctx.extra["rarity"] = "Epic";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Loot, "Box opened", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<BoxId> boxId;
    std::optional<ItemInstanceId> itemId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger on top of kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to the registry logger named `lbx.<Category>`
/// and falls back to the registry's default logger.  Implementation
/// details are hidden behind PIMPL.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | ECS         | Info          |
/// | Plugin      | Info          |
/// | Config      | Info          |
/// | Loot        | Debug         |
/// | Economy     | Debug         |
/// | Progression | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by the formatted context fields.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry's default logger.
    GameResult<void> flush();

    /// Process-wide instance used by the LBX_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lbx::foundation

/// @name LBX_LOG Macros
/// @brief Logging macros with a compile-time floor and a runtime level check.
///
/// Define LBX_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef LBX_MIN_LOG_LEVEL
    #define LBX_MIN_LOG_LEVEL 0
#endif

#define LBX_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= LBX_MIN_LOG_LEVEL &&                      \
            ::lbx::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::lbx::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define LBX_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                         \
        if (static_cast<int>(level) >= LBX_MIN_LOG_LEVEL &&                      \
            ::lbx::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::lbx::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
    } while (0)

#define LBX_LOG_DEBUG(cat, msg) \
    LBX_LOG(::lbx::foundation::LogLevel::Debug, (cat), (msg))

#define LBX_LOG_INFO(cat, msg) \
    LBX_LOG(::lbx::foundation::LogLevel::Info, (cat), (msg))

#define LBX_LOG_WARN(cat, msg) \
    LBX_LOG(::lbx::foundation::LogLevel::Warning, (cat), (msg))

#define LBX_LOG_ERROR(cat, msg) \
    LBX_LOG(::lbx::foundation::LogLevel::Error, (cat), (msg))

/// @}
