#pragma once

/// @file combat_log.hpp
/// @brief Append-only, human-readable battle narrative read by UI consumers.

#include <cstdint>
#include <string>
#include <vector>

#include "cce/foundation/game_logger.hpp"

namespace cce::combat {

struct CombatLogEntry {
    uint64_t sequence = 0;
    foundation::LogCategory source = foundation::LogCategory::Combat;
    std::string message;
};

/// Every mutating engine call appends one line here. Entries are never
/// modified or removed; each append is mirrored to GameLogger at Debug.
class CombatLog {
public:
    void append(foundation::LogCategory source, std::string message);

    [[nodiscard]] const std::vector<CombatLogEntry>& entries() const noexcept { return entries_; }

    /// The last @p count messages, oldest first.
    [[nodiscard]] std::vector<std::string> tail(std::size_t count) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<CombatLogEntry> entries_;
};

}  // namespace cce::combat
