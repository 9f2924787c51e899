#pragma once

/// @file scenario_loader.hpp
/// @brief Scenario data structures and the JSON scenario loader and writer.
/// @ingroup io_loaders

#include <ridesim/core/types.hpp>

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ridesim::io {

/// @brief A rider entering the simulation with a request for a driver.
///
/// @ingroup io_loaders
/// @see ScenarioData
struct RiderRequestParams {
    core::TimePoint time{};        ///< When the rider requests a driver.
    std::string id;                ///< Unique rider identifier.
    core::Location origin;         ///< Pickup location.
    core::Location destination;    ///< Dropoff location.
    core::Duration patience{};     ///< Ticks before the rider cancels.
};

/// @brief A driver entering the simulation with a request for a rider.
///
/// @ingroup io_loaders
/// @see ScenarioData
struct DriverRequestParams {
    core::TimePoint time{};   ///< When the driver requests a rider.
    std::string id;           ///< Unique driver identifier.
    core::Location location;  ///< Starting location.
    core::Speed speed{};      ///< Cells per tick.
};

/// @brief One initial request, rider or driver.
using RequestParams = std::variant<RiderRequestParams, DriverRequestParams>;

/// @brief Complete scenario definition: the initial requests of a run.
///
/// Requests keep the order in which they were read. Requests sharing a
/// timestamp fire in that order, so it is part of the scenario.
///
/// @ingroup io_loaders
/// @see load_scenario, load_event_script, inject_scenario
struct ScenarioData {
    std::vector<RequestParams> requests;  ///< Initial requests, in file order.
};

/// @brief Load a scenario from a JSON file.
///
/// @param path  Filesystem path to the JSON scenario file.
/// @return Parsed scenario data.
///
/// @throws LoaderError  If the file cannot be read or contains invalid JSON.
///
/// @see load_scenario_from_string, inject_scenario
ScenarioData load_scenario(const std::filesystem::path& path);

/// @brief Load a scenario from a JSON string.
///
/// The document holds a `requests` array; each element has a `type`
/// (`"rider"` or `"driver"`), a `time` and an `id`. Riders add `origin`,
/// `destination` (two-element `[row, col]` arrays) and `patience`;
/// drivers add `location` and `speed`.
///
/// @param json  JSON content describing the scenario.
/// @return Parsed scenario data.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
///
/// @see load_scenario
ScenarioData load_scenario_from_string(std::string_view json);

/// @brief Write a scenario to a JSON file.
/// @see write_scenario_to_stream
void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path);

/// @brief Write a scenario to an output stream in the format read by load_scenario.
void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out);

} // namespace ridesim::io
