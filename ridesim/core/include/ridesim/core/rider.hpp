#pragma once

#include <ridesim/core/types.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace ridesim::core {

/// @brief Where a rider stands in the matching process.
/// @ingroup core
enum class RiderStatus {
    Waiting,    ///< Requested a ride, not yet picked up or cancelled.
    Cancelled,  ///< Gave up before any driver arrived.
    Satisfied,  ///< Picked up by a driver.
};

/// @brief Lower-case name of a rider status (`"waiting"`, ...).
[[nodiscard]] std::string_view to_string(RiderStatus status) noexcept;

/// @brief A participant asking to be driven from an origin to a destination.
/// @ingroup core
///
/// A rider is created when its request is injected into the engine and
/// starts out Waiting. Its status changes at most once, either to
/// Cancelled when its patience runs out or to Satisfied when a driver
/// picks it up, and never reverts.
///
/// Riders are identified by their identifier; the dispatcher never relies
/// on object identity or on comparing the other fields.
///
/// @see Driver, Dispatcher
class Rider {
public:
    /// @brief Construct a waiting rider.
    /// @param id          Unique identifier.
    /// @param origin      Pickup location.
    /// @param destination Dropoff location.
    /// @param patience    Ticks the rider waits before cancelling.
    Rider(std::string id, Location origin, Location destination, Duration patience);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] Location origin() const noexcept { return origin_; }
    [[nodiscard]] Location destination() const noexcept { return destination_; }
    [[nodiscard]] Duration patience() const noexcept { return patience_; }
    [[nodiscard]] RiderStatus status() const noexcept { return status_; }

    /// @brief Mark the rider as cancelled.
    ///
    /// No-op when already cancelled.
    ///
    /// @throws InvalidStateError if the rider is already satisfied.
    void cancel();

    /// @brief Mark the rider as picked up.
    ///
    /// No-op when already satisfied (a second driver may reach a rider
    /// that is still listed as waiting when it was dispatched).
    ///
    /// @throws InvalidStateError if the rider has cancelled.
    void satisfy();

    Rider(const Rider&) = delete;
    Rider& operator=(const Rider&) = delete;
    Rider(Rider&&) = default;
    Rider& operator=(Rider&&) = default;

private:
    std::string id_;
    Location origin_;
    Location destination_;
    Duration patience_;
    RiderStatus status_{RiderStatus::Waiting};
};

/// @brief Stream `ID: <id>, Origin: (r,c), Destination: (r,c), Status: <s>, Patience: <p>`.
std::ostream& operator<<(std::ostream& os, const Rider& rider);

} // namespace ridesim::core
