#pragma once

/// @file simulation.hpp
/// @brief One-call driver: scenario in, report out.
/// @ingroup io

#include <ridesim/io/monitor.hpp>
#include <ridesim/io/scenario_loader.hpp>
#include <ridesim/core/dispatcher.hpp>
#include <ridesim/core/trace_writer.hpp>

#include <optional>

namespace ridesim::io {

/// @brief Knobs of a simulation run.
/// @ingroup io
struct SimulationOptions {
    core::MatchPolicy policy{core::MatchPolicy::Reserve};  ///< Dispatcher behaviour.
    std::optional<core::TimePoint> until;  ///< Stop after this tick; run to completion if empty.
    core::TraceWriter* trace_writer{nullptr};  ///< Optional event log, not owned.
};

/// @brief Run @p scenario to completion (or to @p options.until) and report.
///
/// Builds an Engine around a fresh Monitor, injects the scenario and
/// runs it.
///
/// @throws LoaderError          If the scenario reuses an identifier.
/// @throws core::SimulationError If an entity is driven into an invalid state.
///
/// @see inject_scenario, Monitor::report
Report run_simulation(const ScenarioData& scenario, const SimulationOptions& options = {});

} // namespace ridesim::io
