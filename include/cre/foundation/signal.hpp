#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> for dispatching combat events to observers.
///
/// Slots fire in connection order. A world is stepped from one thread, so
/// the signal carries no locking; emit() snapshots the slot list so a slot
/// may connect or disconnect while the signal is firing.

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace cre::foundation {

/// Ordered observer list that dispatches events to registered callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<Entity, int> onDefeated;
///   auto id = onDefeated.connect([](Entity e, int overkill) {
///       std::cout << "entity " << e.id() << " overkill " << overkill << "\n";
///   });
///   onDefeated.emit(target, 5);
///   onDefeated.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) { slots_.erase(id); }

    void disconnectAll() { slots_.clear(); }

    void emit(Args... args) const {
        if (slots_.empty()) {
            return;
        }
        std::vector<Slot> snapshot;
        snapshot.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            snapshot.push_back(slot);
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const { return slots_.size(); }

private:
    std::map<SlotId, Slot> slots_;
    SlotId nextId_ = 1;
};

} // namespace cre::foundation
