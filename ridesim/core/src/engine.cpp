#include <ridesim/core/engine.hpp>
#include <ridesim/core/driver.hpp>
#include <ridesim/core/error.hpp>
#include <ridesim/core/notifier.hpp>
#include <ridesim/core/rider.hpp>

#include <type_traits>
#include <utility>

namespace ridesim::core {

Engine::Engine(Notifier& notifier, MatchPolicy policy)
    : notifier_(notifier)
    , dispatcher_(policy) {}

Engine::~Engine() = default;

void Engine::run() {
    while (!queue_.empty()) {
        process_next_event();
    }

    trace([this](TraceWriter& w) {
        w.type("sim_finished");
        w.field("processed_events", processed_events_);
    });
}

void Engine::run(TimePoint until) {
    while (!queue_.empty()) {
        // Check if next event is beyond our stop time
        if (queue_.next_time() > until) {
            break;
        }
        process_next_event();
    }
    if (current_time_ < until) {
        current_time_ = until;
    }
}

Rider& Engine::add_rider(std::string id, Location origin, Location destination, Duration patience) {
    if (riders_by_id_.contains(id)) {
        throw DuplicateIdError("Rider " + id + " already exists");
    }

    riders_.push_back(std::make_unique<Rider>(std::move(id), origin, destination, patience));
    Rider& rider = *riders_.back();
    riders_by_id_.emplace(rider.id(), &rider);
    return rider;
}

Driver& Engine::add_driver(std::string id, Location location, Speed speed) {
    if (drivers_by_id_.contains(id)) {
        throw DuplicateIdError("Driver " + id + " already exists");
    }

    drivers_.push_back(std::make_unique<Driver>(std::move(id), location, speed));
    Driver& driver = *drivers_.back();
    drivers_by_id_.emplace(driver.id(), &driver);
    return driver;
}

Rider* Engine::find_rider(std::string_view id) const {
    auto it = riders_by_id_.find(std::string(id));
    return it == riders_by_id_.end() ? nullptr : it->second;
}

Driver* Engine::find_driver(std::string_view id) const {
    auto it = drivers_by_id_.find(std::string(id));
    return it == drivers_by_id_.end() ? nullptr : it->second;
}

void Engine::schedule(ScheduledEvent scheduled) {
    if (scheduled.time < current_time_) {
        throw InvalidStateError("Cannot schedule event in the past");
    }
    queue_.add(std::move(scheduled));
}

void Engine::schedule_rider_request(Rider& rider, TimePoint when) {
    schedule({when, RiderRequestEvent{&rider}});
}

void Engine::schedule_driver_request(Driver& driver, TimePoint when) {
    schedule({when, DriverRequestEvent{&driver}});
}

void Engine::set_trace_writer(TraceWriter* writer) noexcept {
    trace_writer_ = writer;
}

void Engine::process_next_event() {
    ScheduledEvent scheduled = queue_.remove_min();
    current_time_ = scheduled.time;

    trace_event(scheduled);
    std::vector<ScheduledEvent> follow_ups = apply_event(scheduled, dispatcher_, notifier_);
    ++processed_events_;

    for (auto& next : follow_ups) {
        schedule(std::move(next));
    }
}

void Engine::trace_event(const ScheduledEvent& scheduled) {
    trace([&scheduled](TraceWriter& w) {
        w.type(event_name(scheduled.event));
        std::visit([&w](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (requires { ev.rider; }) {
                w.field("rider", std::string_view{ev.rider->id()});
            }
            if constexpr (requires { ev.driver; }) {
                w.field("driver", std::string_view{ev.driver->id()});
            }
            if constexpr (std::is_same_v<T, RiderRequestEvent>) {
                w.field("patience", ev.rider->patience());
            } else if constexpr (std::is_same_v<T, DriverRequestEvent>) {
                w.field("speed", ev.driver->speed());
            }
        }, scheduled.event);
    });
}

} // namespace ridesim::core
