#pragma once

#include <ridesim/core/event.hpp>

#include <cstddef>
#include <cstdint>
#include <map>

namespace ridesim::core {

/// @brief Priority queue of scheduled events.
/// @ingroup core_events
///
/// Events come out in non-decreasing timestamp order. Events sharing a
/// timestamp come out in the order they were added, which keeps a run
/// reproducible from its initial event list.
///
/// @see EventKey, Engine
class EventQueue {
public:
    /// @brief Insert an event. O(log n).
    void add(ScheduledEvent scheduled);

    /// @brief Remove and return the earliest event.
    /// @throws EmptyQueueError if the queue holds no events.
    ScheduledEvent remove_min();

    /// @brief Timestamp of the earliest event.
    /// @throws EmptyQueueError if the queue holds no events.
    [[nodiscard]] TimePoint next_time() const;

    [[nodiscard]] bool empty() const noexcept { return events_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }

private:
    uint64_t sequence_{0};
    std::map<EventKey, Event> events_;
};

} // namespace ridesim::core
