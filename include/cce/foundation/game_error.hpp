#pragma once

/// @file game_error.hpp
/// @brief Engine error type used with Result<T, GameError>.

#include <any>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "cce/foundation/error_code.hpp"

namespace cce::foundation {

/// Resource named in a ResourceShortfall.
enum class ResourceKind : uint8_t { Charge, Durability, Cooldown };

/// Context attached to resource errors so a caller can present the shortfall.
///
/// For Cooldown, `available` is the current logical time and `required`
/// the time at which the effect becomes ready again.
struct ResourceShortfall {
    ResourceKind resource = ResourceKind::Charge;
    int64_t available = 0;
    int64_t required = 0;
};

/// Error code, human-readable message and optional typed context.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace cce::foundation
