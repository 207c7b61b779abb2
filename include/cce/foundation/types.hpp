#pragma once

/// @file types.hpp
/// @brief Strong ID types and identifier aliases shared by all components.

#include <cstdint>
#include <functional>
#include <string>

namespace cce::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};

/// Unique identifier for a player owning weapon instances.
using PlayerId = StrongId<PlayerIdTag>;

/// Catalog identifiers are authored as strings ("nova_blaster").
using TemplateId = std::string;
using EffectId = std::string;
using ComponentId = std::string;
using EvolutionId = std::string;

/// Logical clock: a turn count or explicit combat time, never wall-clock.
using LogicalTime = int64_t;

} // namespace cce::foundation

template <typename Tag, typename T>
struct std::hash<cce::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const cce::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
