#pragma once

#include <ridesim/core/types.hpp>

#include <string_view>

namespace ridesim::core {

/// @brief Kind of participant a notification is about.
/// @ingroup core
enum class ActorKind {
    Rider,
    Driver,
};

/// @brief Observable transition reported to a Notifier.
/// @ingroup core
enum class Action {
    Request,
    Cancel,
    Pickup,
    Dropoff,
};

[[nodiscard]] std::string_view to_string(ActorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Action action) noexcept;

/// @brief Abstract sink for the activities that happen during a simulation.
/// @ingroup core
///
/// Events call notify() once per observable transition, in the order the
/// transitions happen. The core never reads anything back: aggregating
/// the activities into statistics is entirely the sink's business.
///
/// @see apply_event
class Notifier {
public:
    virtual ~Notifier() = default;

    /// @brief Record one activity.
    /// @param time     Simulation time of the activity.
    /// @param kind     Whether a rider or a driver acted.
    /// @param action   What happened.
    /// @param id       Identifier of the rider or driver.
    /// @param location Where it happened.
    virtual void notify(TimePoint time, ActorKind kind, Action action,
                        std::string_view id, Location location) = 0;

protected:
    Notifier() = default;
    Notifier(const Notifier&) = default;
    Notifier& operator=(const Notifier&) = default;
    Notifier(Notifier&&) = default;
    Notifier& operator=(Notifier&&) = default;
};

} // namespace ridesim::core
