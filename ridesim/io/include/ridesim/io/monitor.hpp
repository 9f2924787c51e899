#pragma once

/// @file monitor.hpp
/// @brief Activity recorder and the summary report derived from it.
/// @ingroup io_metrics

#include <ridesim/core/notifier.hpp>
#include <ridesim/core/types.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ridesim::io {

/// @brief One notification received by the Monitor.
/// @ingroup io_metrics
struct Activity {
    core::TimePoint time;      ///< When it happened.
    core::Action action;       ///< What happened.
    core::Location location;   ///< Where it happened.
};

/// @brief Summary statistics of a run.
///
/// A statistic is empty when no rider or driver qualifies for it.
///
/// @ingroup io_metrics
/// @see Monitor::report
struct Report {
    /// @brief Mean delay between a rider's first and second activity
    /// (request, then pickup or cancellation).
    std::optional<double> rider_wait_time;

    /// @brief Mean distance covered per driver, over drivers with at
    /// least two activities.
    std::optional<double> driver_total_distance;

    /// @brief Total pickup-to-dropoff distance divided by the number of
    /// drivers that reported at least one activity.
    std::optional<double> driver_ride_distance;

    bool operator==(const Report&) const = default;
};

/// @brief Notifier that records every activity, grouped by actor.
///
/// Activities are kept per actor kind and identifier in the order they
/// were notified.
///
/// @code
/// io::Monitor monitor;
/// core::Engine engine(monitor);
/// // ... inject requests, run ...
/// io::write_report_to_stream(monitor.report(), std::cout);
/// @endcode
///
/// @ingroup io_metrics
/// @see core::Notifier, Report
class Monitor : public core::Notifier {
public:
    void notify(core::TimePoint time, core::ActorKind kind, core::Action action,
                std::string_view id, core::Location location) override;

    /// @brief Compute the summary statistics of everything recorded so far.
    [[nodiscard]] Report report() const;

    /// @brief Number of distinct riders that were notified about.
    [[nodiscard]] std::size_t rider_count() const noexcept { return riders_.size(); }

    /// @brief Number of distinct drivers that were notified about.
    [[nodiscard]] std::size_t driver_count() const noexcept { return drivers_.size(); }

    /// @brief Activities recorded for one actor, oldest first.
    ///
    /// Returns an empty list for an unknown identifier.
    [[nodiscard]] const std::vector<Activity>& activities(core::ActorKind kind,
                                                          std::string_view id) const;

private:
    using ActivityLog = std::map<std::string, std::vector<Activity>, std::less<>>;

    [[nodiscard]] const ActivityLog& log(core::ActorKind kind) const noexcept;

    ActivityLog riders_;
    ActivityLog drivers_;
};

/// @brief Stream `Monitor (<n> drivers, <m> riders)`.
std::ostream& operator<<(std::ostream& os, const Monitor& monitor);

/// @brief Write a report as a JSON object.
///
/// Keys are `rider_wait_time`, `driver_total_distance` and
/// `driver_ride_distance`; empty statistics are written as `null`.
///
/// @ingroup io_metrics
void write_report_to_stream(const Report& report, std::ostream& out);

} // namespace ridesim::io
