#include <ridesim/core/event_queue.hpp>
#include <ridesim/core/error.hpp>

#include <utility>

namespace ridesim::core {

void EventQueue::add(ScheduledEvent scheduled) {
    EventKey key{scheduled.time, sequence_++};
    events_.emplace(key, std::move(scheduled.event));
}

ScheduledEvent EventQueue::remove_min() {
    if (events_.empty()) {
        throw EmptyQueueError("Cannot remove an event from an empty queue");
    }

    auto it = events_.begin();
    ScheduledEvent scheduled{it->first.time, std::move(it->second)};
    events_.erase(it);
    return scheduled;
}

TimePoint EventQueue::next_time() const {
    if (events_.empty()) {
        throw EmptyQueueError("Event queue is empty");
    }
    return events_.begin()->first.time;
}

} // namespace ridesim::core
