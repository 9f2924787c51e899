#pragma once

#include <ridesim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <variant>
#include <vector>

namespace ridesim::core {

class Dispatcher;
class Driver;
class Notifier;
class Rider;

/// @brief Deterministic ordering key for events in the queue.
///
/// Events are ordered first by simulation time, then by insertion
/// sequence number, so events sharing a timestamp fire in the order they
/// were scheduled.
///
/// @see EventQueue
/// @ingroup core_events
struct EventKey {
    TimePoint time;      ///< Primary: simulation time at which the event fires.
    uint64_t sequence;   ///< Secondary: insertion order for determinism.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief A rider asks the dispatcher for a driver.
/// @ingroup core_events
struct RiderRequestEvent {
    Rider* rider;  ///< Rider making the request.
};

/// @brief A driver asks the dispatcher for a rider.
///
/// Registers the driver with the dispatcher the first time it fires.
///
/// @ingroup core_events
struct DriverRequestEvent {
    Driver* driver;  ///< Driver making the request.
};

/// @brief A rider's patience runs out.
///
/// Has no effect on a rider who was already picked up.
///
/// @ingroup core_events
struct CancellationEvent {
    Rider* rider;  ///< Rider giving up.
};

/// @brief A driver reaches a rider's origin.
/// @ingroup core_events
struct PickupEvent {
    Rider* rider;    ///< Rider being picked up.
    Driver* driver;  ///< Driver arriving at the rider's origin.
};

/// @brief A driver reaches a rider's destination.
/// @ingroup core_events
struct DropoffEvent {
    Rider* rider;    ///< Rider being dropped off.
    Driver* driver;  ///< Driver arriving at the rider's destination.
};

/// @brief Variant holding all possible event types in the simulation.
///
/// The Engine dispatches events by visiting this variant through
/// apply_event().
///
/// @see ScheduledEvent, Engine
/// @ingroup core_events
using Event = std::variant<
    RiderRequestEvent,
    DriverRequestEvent,
    CancellationEvent,
    PickupEvent,
    DropoffEvent
>;

/// @brief An event together with the time at which it fires.
/// @ingroup core_events
struct ScheduledEvent {
    TimePoint time;  ///< When the event fires.
    Event event;     ///< What happens.
};

/// @brief Apply an event to the dispatcher and report what happened.
///
/// Performs the event's state transitions on the riders, drivers and
/// dispatcher it involves, calls @p notifier once per observable
/// transition, and returns the follow-up events in the order they must
/// be enqueued. The event itself is left untouched.
///
/// | Event          | Follow-up events                                        |
/// |----------------|---------------------------------------------------------|
/// | RiderRequest   | Pickup (if a driver was found), then Cancellation       |
/// | DriverRequest  | Pickup (if a rider is waiting)                          |
/// | Cancellation   | none                                                    |
/// | Pickup         | Dropoff, or DriverRequest if the rider had cancelled    |
/// | Dropoff        | DriverRequest                                           |
///
/// @param scheduled  The event to apply, with its firing time.
/// @param dispatcher Matching state.
/// @param notifier   Receives one notification per transition.
/// @return Follow-up events.
/// @throws InvalidStateError if a rider or driver is not in the state the
///         event requires.
std::vector<ScheduledEvent> apply_event(const ScheduledEvent& scheduled,
                                        Dispatcher& dispatcher,
                                        Notifier& notifier);

/// @brief Short snake_case name of an event type (`"pickup"`, ...).
[[nodiscard]] std::string_view event_name(const Event& event) noexcept;

/// @brief Stream a one-line description such as `4 -- ID: xyz, ...: Cancellation by rider`.
std::ostream& operator<<(std::ostream& os, const ScheduledEvent& scheduled);

} // namespace ridesim::core
