#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace ridesim::core {

/// @brief Absolute simulation time, in ticks since the start of the run.
///
/// Simulation time is an internal counter with no relation to wall-clock
/// time. Ticks are non-negative.
///
/// @ingroup core_types
using TimePoint = std::uint64_t;

/// @brief Length of a simulated interval, in ticks.
/// @ingroup core_types
using Duration = std::uint64_t;

/// @brief Grid cells travelled per tick.
///
/// A speed of zero is accepted and yields a zero travel time.
///
/// @ingroup core_types
using Speed = std::uint64_t;

/// @brief A cell of the city grid.
///
/// Rows and columns are non-negative. Locations are plain values and
/// compare equal when both coordinates match.
///
/// @see manhattan_distance
/// @ingroup core_types
struct Location {
    std::int64_t row{0};  ///< Grid row.
    std::int64_t col{0};  ///< Grid column.

    constexpr bool operator==(const Location&) const noexcept = default;
};

/// @brief Grid (Manhattan) distance between two locations.
/// @param from First location.
/// @param to   Second location.
/// @return `|from.row - to.row| + |from.col - to.col|`.
/// @ingroup core_types
[[nodiscard]] constexpr std::uint64_t manhattan_distance(Location from, Location to) noexcept {
    // Coordinates are non-negative, so each difference fits in int64_t
    std::int64_t drow = from.row - to.row;
    std::int64_t dcol = from.col - to.col;
    return static_cast<std::uint64_t>(drow < 0 ? -drow : drow)
         + static_cast<std::uint64_t>(dcol < 0 ? -dcol : dcol);
}

/// @brief Ticks needed to cover the distance between two locations.
///
/// Computes `distance / speed` rounded to the nearest integer, with exact
/// halves rounded to the even neighbour (so 5/2 gives 2 and 7/2 gives 4).
/// A zero speed yields a zero travel time.
///
/// @param from  Start location.
/// @param to    End location.
/// @param speed Cells per tick.
/// @return Travel time in ticks.
/// @ingroup core_types
[[nodiscard]] constexpr Duration travel_time(Location from, Location to, Speed speed) noexcept {
    if (speed == 0) {
        return 0;
    }
    std::uint64_t distance = manhattan_distance(from, to);
    Duration quotient = distance / speed;
    std::uint64_t twice_remainder = 2 * (distance % speed);
    if (twice_remainder > speed || (twice_remainder == speed && (quotient % 2) == 1)) {
        ++quotient;
    }
    return quotient;
}

/// @brief Render a location as `(row,col)`.
[[nodiscard]] std::string to_string(Location location);

/// @brief Stream a location as `(row,col)`.
std::ostream& operator<<(std::ostream& os, Location location);

} // namespace ridesim::core
