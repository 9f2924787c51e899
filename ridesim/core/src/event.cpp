#include <ridesim/core/event.hpp>
#include <ridesim/core/dispatcher.hpp>
#include <ridesim/core/driver.hpp>
#include <ridesim/core/error.hpp>
#include <ridesim/core/notifier.hpp>
#include <ridesim/core/rider.hpp>

#include <limits>
#include <string>
#include <type_traits>

namespace ridesim::core {

namespace {

TimePoint later(TimePoint now, Duration delay, const std::string& what) {
    if (delay > std::numeric_limits<TimePoint>::max() - now) {
        throw InvalidStateError(what + " time overflows: " + std::to_string(now) + " + " + std::to_string(delay));
    }
    return now + delay;
}

// One overload per alternative: adding an event type without its
// transition fails to compile.
class EventApplier {
public:
    EventApplier(TimePoint now, Dispatcher& dispatcher, Notifier& notifier)
        : now_(now)
        , dispatcher_(dispatcher)
        , notifier_(notifier) {}

    std::vector<ScheduledEvent> operator()(const RiderRequestEvent& ev) const {
        Rider& rider = *ev.rider;
        notifier_.notify(now_, ActorKind::Rider, Action::Request, rider.id(), rider.origin());

        std::vector<ScheduledEvent> events;
        if (Driver* driver = dispatcher_.request_driver(rider)) {
            if (!driver->is_idle()) {
                throw DoubleBookingError("Driver " + driver->id() + " matched to rider " + rider.id() +
                                         " while already serving another rider");
            }
            Duration eta = driver->start_drive(rider.origin());
            events.push_back({later(now_, eta, "Pickup"), PickupEvent{&rider, driver}});
        }
        events.push_back({later(now_, rider.patience(), "Cancellation"), CancellationEvent{&rider}});
        return events;
    }

    std::vector<ScheduledEvent> operator()(const DriverRequestEvent& ev) const {
        Driver& driver = *ev.driver;
        notifier_.notify(now_, ActorKind::Driver, Action::Request, driver.id(), driver.location());

        std::vector<ScheduledEvent> events;
        if (Rider* rider = dispatcher_.request_rider(driver)) {
            Duration eta = driver.start_drive(rider->origin());
            events.push_back({later(now_, eta, "Pickup"), PickupEvent{rider, &driver}});
        }
        return events;
    }

    std::vector<ScheduledEvent> operator()(const CancellationEvent& ev) const {
        Rider& rider = *ev.rider;
        notifier_.notify(now_, ActorKind::Rider, Action::Cancel, rider.id(), rider.origin());

        if (!dispatcher_.is_satisfied(rider.id())) {
            rider.cancel();
            dispatcher_.cancel_ride(rider);
        }
        return {};
    }

    std::vector<ScheduledEvent> operator()(const PickupEvent& ev) const {
        Rider& rider = *ev.rider;
        Driver& driver = *ev.driver;

        driver.end_drive();
        notifier_.notify(now_, ActorKind::Rider, Action::Pickup, rider.id(), rider.origin());
        notifier_.notify(now_, ActorKind::Driver, Action::Pickup, driver.id(), driver.location());

        if (dispatcher_.is_cancelled(rider.id())) {
            driver.release();
            return {{now_, DriverRequestEvent{&driver}}};
        }

        Duration eta = driver.start_ride(rider);
        rider.satisfy();
        dispatcher_.end_successful_ride(rider);
        return {{later(now_, eta, "Dropoff"), DropoffEvent{&rider, &driver}}};
    }

    std::vector<ScheduledEvent> operator()(const DropoffEvent& ev) const {
        Rider& rider = *ev.rider;
        Driver& driver = *ev.driver;

        driver.end_ride();
        notifier_.notify(now_, ActorKind::Driver, Action::Dropoff, driver.id(), driver.location());
        dispatcher_.end_successful_ride(rider);
        return {{now_, DriverRequestEvent{&driver}}};
    }

private:
    TimePoint now_;
    Dispatcher& dispatcher_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    Notifier& notifier_;      // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

struct EventNamer {
    std::string_view operator()(const RiderRequestEvent&) const noexcept { return "rider_request"; }
    std::string_view operator()(const DriverRequestEvent&) const noexcept { return "driver_request"; }
    std::string_view operator()(const CancellationEvent&) const noexcept { return "cancellation"; }
    std::string_view operator()(const PickupEvent&) const noexcept { return "pickup"; }
    std::string_view operator()(const DropoffEvent&) const noexcept { return "dropoff"; }
};

} // anonymous namespace

std::vector<ScheduledEvent> apply_event(const ScheduledEvent& scheduled,
                                        Dispatcher& dispatcher,
                                        Notifier& notifier) {
    return std::visit(EventApplier{scheduled.time, dispatcher, notifier}, scheduled.event);
}

std::string_view event_name(const Event& event) noexcept {
    return std::visit(EventNamer{}, event);
}

std::ostream& operator<<(std::ostream& os, const ScheduledEvent& scheduled) {
    os << scheduled.time << " -- ";
    std::visit([&os](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, RiderRequestEvent>) {
            os << *ev.rider << ": Request a driver";
        } else if constexpr (std::is_same_v<T, DriverRequestEvent>) {
            os << *ev.driver << ": Request a rider";
        } else if constexpr (std::is_same_v<T, CancellationEvent>) {
            os << *ev.rider << ": Cancellation by rider";
        } else if constexpr (std::is_same_v<T, PickupEvent>) {
            os << *ev.driver << " -- " << *ev.rider << ": Pick up time by driver of rider";
        } else if constexpr (std::is_same_v<T, DropoffEvent>) {
            os << *ev.driver << " -- " << *ev.rider << ": Dropoff time by driver of rider";
        }
    }, scheduled.event);
    return os;
}

} // namespace ridesim::core
