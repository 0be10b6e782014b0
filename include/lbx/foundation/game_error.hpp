#pragma once

/// @file game_error.hpp
/// @brief Error type carried by GameResult<T>.

#include <string>
#include <string_view>
#include <utility>

#include "lbx/foundation/error_code.hpp"

namespace lbx::foundation {

/// Error code plus a human-readable message.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// True for codes that report a skipped no-op rather than a failure.
    [[nodiscard]] bool isInformational() const noexcept {
        return code_ == ErrorCode::PoolAtCapacity;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace lbx::foundation
