#pragma once
// Signal.hpp - Minimal thread-safe signal/slot for non-QObject classes
// Slots run on the emitting thread; UI code marshals with invokeMethod

#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace babel {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = unsigned long;

    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    SlotId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        SlotId id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) {
        std::lock_guard lock(mutex_);
        slots_.erase(id);
    }

    void disconnectAll() {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    // Slots are copied out first so a slot may connect/disconnect safely
    void emitSignal(Args... args) {
        std::vector<Slot> current;
        {
            std::lock_guard lock(mutex_);
            current.reserve(slots_.size());
            for (const auto& [id, slot] : slots_)
                current.push_back(slot);
        }
        for (auto& slot : current)
            slot(args...);
    }

    void operator()(Args... args) {
        emitSignal(args...);
    }

    std::size_t slotCount() const {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

private:
    std::map<SlotId, Slot> slots_;
    SlotId nextId_{1};
    mutable std::mutex mutex_;
};

} // namespace babel
