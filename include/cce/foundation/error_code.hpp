#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat engine.

#include <cstdint>
#include <string_view>

namespace cce::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the producing
/// component can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Weapon catalog & instances (0x0900 - 0x09FF)
    WeaponNotFound = 0x0900,
    DuplicateTemplate = 0x0901,
    MissingRequiredField = 0x0902,
    AlreadyAssigned = 0x0903,
    EffectNotFound = 0x0904,
    NotEligible = 0x0905,
    EffectOnCooldown = 0x0906,
    InsufficientCharge = 0x0907,
    InsufficientDurability = 0x0908,
    WeaponBroken = 0x0909,

    // Progression (0x0A00 - 0x0AFF)
    NoEvolutionSlots = 0x0A00,
    EvolutionNotAvailable = 0x0A01,

    // Crafting (0x0B00 - 0x0BFF)
    MissingRequiredComponent = 0x0B00,
    NoCompatibleCategory = 0x0B01,
    IncompatibleComponent = 0x0B02,
    UnknownComponent = 0x0B03,
    DuplicateComponent = 0x0B04,
    NotCrafted = 0x0B05,

    // Combat session (0x0C00 - 0x0CFF)
    InvalidCombatState = 0x0C00,
    CombatNotInProgress = 0x0C01,
    NotActorsTurn = 0x0C02,
    UnknownParticipant = 0x0C03,
    MissingTarget = 0x0C04,
    InvalidTarget = 0x0C05,

    // Persistence (0x0D00 - 0x0DFF)
    SnapshotInvalid = 0x0D00,
    CatalogLoadFailed = 0x0D01,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Weapon";
        case 0x0A00: return "Progression";
        case 0x0B00: return "Crafting";
        case 0x0C00: return "Combat";
        case 0x0D00: return "Persistence";
        default: return "Unknown";
    }
}

/// True for the shortfall family of errors (charge, durability, cooldown).
constexpr bool isResourceError(ErrorCode code) {
    return code == ErrorCode::InsufficientCharge
        || code == ErrorCode::InsufficientDurability
        || code == ErrorCode::EffectOnCooldown
        || code == ErrorCode::WeaponBroken;
}

/// True for errors caused by acting in the wrong session or ownership state.
constexpr bool isStateError(ErrorCode code) {
    return code == ErrorCode::AlreadyAssigned
        || code == ErrorCode::NotActorsTurn
        || code == ErrorCode::CombatNotInProgress
        || code == ErrorCode::InvalidCombatState;
}

} // namespace cce::foundation
