#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon logger interface for engine diagnostics.
///
/// Category-based filtering with per-category runtime levels. This is the
/// operator-facing diagnostic channel; the player-facing battle narrative
/// lives in cce::combat::CombatLog and is mirrored here at Debug.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cce/foundation/game_result.hpp"
#include "cce/foundation/types.hpp"

namespace cce::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories, one per subsystem.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Startup, tools, aggregate wiring
    Config      = 1, ///< Configuration loading
    Weapon      = 2, ///< Catalog and instance registry
    Effect      = 3, ///< Effect resolution
    Progression = 4, ///< Experience and evolution
    Crafting    = 5, ///< Crafting and disassembly
    Combat      = 6, ///< Combat session state machine
    Persistence = 7  ///< Catalog loading and snapshots
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Weapon", "Effect",
        "Progression", "Crafting", "Combat", "Persistence"
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

/// Structured context appended to a log line as key=value pairs.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerId = PlayerId(1);
///   ctx.weaponId = "nova_blaster";
///   ctx.extra["charge"] = "40";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Weapon,
///                         "trigger rejected", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<std::string> weaponId;
    std::optional<std::string> effectId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger forwarding to the kcenon GlobalLoggerRegistry.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Config      | Info          |
/// | Weapon      | Info          |
/// | Effect      | Debug         |
/// | Progression | Info          |
/// | Crafting    | Info          |
/// | Combat      | Debug         |
/// | Persistence | Info          |
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

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    GameResult<void> flush();

    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "trace" / "debug" / ... (case-insensitive). Unknown names yield nullopt.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace cce::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// CCE_MIN_LOG_LEVEL may be defined before including this header to compile
/// out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef CCE_MIN_LOG_LEVEL
    #define CCE_MIN_LOG_LEVEL 0
#endif

#define CCE_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= CCE_MIN_LOG_LEVEL &&                      \
            ::cce::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::cce::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define CCE_LOG_DEBUG(cat, msg) \
    CCE_LOG(::cce::foundation::LogLevel::Debug, (cat), (msg))

#define CCE_LOG_INFO(cat, msg) \
    CCE_LOG(::cce::foundation::LogLevel::Info, (cat), (msg))

#define CCE_LOG_WARN(cat, msg) \
    CCE_LOG(::cce::foundation::LogLevel::Warning, (cat), (msg))

#define CCE_LOG_ERROR(cat, msg) \
    CCE_LOG(::cce::foundation::LogLevel::Error, (cat), (msg))
