#pragma once

#include <cstddef>
#include <list>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ridesim::core {

class Driver;
class Rider;

/// @brief What the dispatcher does with a driver once it has been matched.
/// @ingroup core
enum class MatchPolicy {
    /// The matched driver leaves the idle partition at match time and
    /// returns to it the next time it requests a rider while idle. A
    /// driver can never be handed to two riders at once.
    Reserve,
    /// Diagnostic mode that detects double booking. The matched driver
    /// stays in the idle partition, which is only written when a driver
    /// registers, so a busy driver can be selected again. The run stops
    /// with DoubleBookingError at the first such selection instead of
    /// re-targeting the driver.
    KeepIdle,
};

/// @brief Matches riders with drivers and tracks who is where.
/// @ingroup core
///
/// Riders go through three partitions: waiting (FIFO), cancelled and
/// satisfied. A rider is in exactly one of them once it has requested a
/// driver. Drivers are tracked in the set of every driver ever
/// registered and in the ordered idle partition used for matching.
///
/// Membership is keyed by identifier. The dispatcher keeps non-owning
/// pointers to the entities, which the Engine owns.
///
/// No operation throws: the absence of a match is reported as nullptr.
///
/// @see MatchPolicy, Engine
class Dispatcher {
public:
    explicit Dispatcher(MatchPolicy policy = MatchPolicy::Reserve);

    [[nodiscard]] MatchPolicy policy() const noexcept { return policy_; }

    /// @brief Add @p rider to the waiting list and find it the closest idle driver.
    ///
    /// The rider is appended to the waiting partition whether or not a
    /// driver is found. The idle driver with the smallest travel time to
    /// the rider's origin is selected; ties go to the driver that entered
    /// the idle partition first. The driver's own state is left to the
    /// caller, which starts the drive.
    ///
    /// @return The selected driver, or nullptr if no driver is idle.
    Driver* request_driver(Rider& rider);

    /// @brief Register @p driver if needed and return the longest-waiting rider.
    ///
    /// A driver seen for the first time joins the set of registered
    /// drivers, and the idle partition if it is idle. The returned rider
    /// stays in the waiting partition until it is picked up or cancels.
    ///
    /// @return The head of the waiting partition, or nullptr if empty.
    Rider* request_rider(Driver& driver);

    /// @brief Move @p rider from waiting to cancelled; no-op otherwise.
    void cancel_ride(const Rider& rider);

    /// @brief Move @p rider from waiting to satisfied; no-op otherwise.
    void end_successful_ride(const Rider& rider);

    [[nodiscard]] bool is_waiting(std::string_view rider_id) const;
    [[nodiscard]] bool is_cancelled(std::string_view rider_id) const;
    [[nodiscard]] bool is_satisfied(std::string_view rider_id) const;
    [[nodiscard]] bool is_idle(std::string_view driver_id) const;
    [[nodiscard]] bool is_registered(std::string_view driver_id) const;

    [[nodiscard]] std::size_t waiting_count() const noexcept { return waiting_.size(); }
    [[nodiscard]] std::size_t cancelled_count() const noexcept { return cancelled_.size(); }
    [[nodiscard]] std::size_t satisfied_count() const noexcept { return satisfied_.size(); }
    [[nodiscard]] std::size_t idle_count() const noexcept { return idle_.size(); }
    [[nodiscard]] std::size_t driver_count() const noexcept { return drivers_.size(); }

    /// @brief Identifiers of the waiting riders, oldest first.
    [[nodiscard]] std::vector<std::string> waiting_riders() const;

    /// @brief Identifiers of the idle drivers, in matching order.
    [[nodiscard]] std::vector<std::string> idle_drivers() const;

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

private:
    friend std::ostream& operator<<(std::ostream& os, const Dispatcher& dispatcher);

    void remove_idle(const Driver& driver);
    bool take_waiting(const Rider& rider);

    MatchPolicy policy_;

    std::list<Rider*> waiting_;
    std::unordered_map<std::string, std::list<Rider*>::iterator> waiting_index_;
    std::unordered_set<std::string> cancelled_;
    std::unordered_set<std::string> satisfied_;

    std::vector<Driver*> idle_;
    std::unordered_map<std::string, Driver*> drivers_;
};

/// @brief Stream a multi-line dump of every partition.
std::ostream& operator<<(std::ostream& os, const Dispatcher& dispatcher);

} // namespace ridesim::core
