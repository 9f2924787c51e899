#pragma once

#include <ridesim/core/types.hpp>

#include <optional>
#include <ostream>
#include <string>

namespace ridesim::core {

class Rider;

/// @brief A vehicle that moves across the grid to serve riders.
/// @ingroup core
///
/// A driver cycles through three phases:
///
/// 1. idle: no destination, eligible for matching;
/// 2. en route: heading to a pickup (start_drive()) or a dropoff
///    (start_ride());
/// 3. engaged at a pickup: arrived at the rider's origin (end_drive())
///    and either starts the ride or is released back to idle.
///
/// Invariant: an idle driver never has a destination. Every transition
/// checks its precondition and throws InvalidStateError when it is
/// violated instead of silently corrupting the driver.
///
/// @see Rider, Dispatcher
class Driver {
public:
    /// @brief Construct an idle driver.
    /// @param id       Unique identifier.
    /// @param location Starting location.
    /// @param speed    Cells travelled per tick (0 means instantaneous).
    Driver(std::string id, Location location, Speed speed);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] Location location() const noexcept { return location_; }
    [[nodiscard]] Speed speed() const noexcept { return speed_; }
    [[nodiscard]] const std::optional<Location>& destination() const noexcept { return destination_; }
    [[nodiscard]] bool is_idle() const noexcept { return idle_; }

    /// @brief Ticks needed to reach @p to from the current location.
    /// @see core::travel_time
    [[nodiscard]] Duration travel_time(Location to) const noexcept;

    /// @brief Leave idle and head for a pickup location.
    /// @param to Where the driver is going.
    /// @return Travel time to @p to.
    /// @throws InvalidStateError if the driver is not idle.
    Duration start_drive(Location to);

    /// @brief Arrive at the pickup location.
    ///
    /// The driver moves to its destination and stays engaged (not idle)
    /// until start_ride() or release().
    ///
    /// @throws InvalidStateError if the driver has no destination.
    void end_drive();

    /// @brief Start driving @p rider to its destination.
    /// @return Travel time to the rider's destination.
    /// @throws InvalidStateError unless the driver is engaged at a pickup.
    Duration start_ride(const Rider& rider);

    /// @brief Arrive at the dropoff location and become idle.
    /// @throws InvalidStateError if the driver has no destination.
    void end_ride();

    /// @brief Return to idle after arriving at a pickup with nobody to drive.
    /// @throws InvalidStateError unless the driver is engaged at a pickup.
    void release();

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;
    Driver(Driver&&) = default;
    Driver& operator=(Driver&&) = default;

private:
    [[nodiscard]] bool engaged_at_pickup() const noexcept { return !idle_ && !destination_; }

    std::string id_;
    Location location_;
    Speed speed_;
    std::optional<Location> destination_;
    bool idle_{true};
};

/// @brief Stream `ID: <id>, Location: (r,c), Speed: <s>`.
std::ostream& operator<<(std::ostream& os, const Driver& driver);

} // namespace ridesim::core
