#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> for observer-style event dispatch between engine components.
///
/// The weapon registry publishes trigger and removal events through signals;
/// the progression and crafting engines subscribe without the registry
/// knowing about them. Slots fire in connection order so that dispatch stays
/// deterministic for a seeded battle.

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace cce::foundation {

/// Observer signal that dispatches events to registered callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<const ProgressionEvent&> onTriggered;
///   auto id = onTriggered.connect([](const ProgressionEvent& ev) {
///       std::cout << ev.effectId << " fired\n";
///   });
///   onTriggered.emit(event);
///   onTriggered.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        std::unique_lock lock(mutex_);
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    /// Invoke every registered slot, oldest first.
    void emit(Args... args) const {
        // Invoke from a snapshot so a slot may connect/disconnect.
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    std::map<SlotId, Slot> slots_;
    SlotId nextId_ = 1;
    mutable std::shared_mutex mutex_;
};

} // namespace cce::foundation
