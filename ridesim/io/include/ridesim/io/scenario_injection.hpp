#pragma once

/// @file scenario_injection.hpp
/// @brief Injecting scenario data into a simulation engine.
/// @ingroup io_loaders

#include <ridesim/io/scenario_loader.hpp>
#include <ridesim/core/engine.hpp>

namespace ridesim::io {

/// @brief Create the scenario's riders and drivers and schedule their requests.
///
/// Requests are scheduled in scenario order, which fixes the firing order
/// of requests that share a timestamp.
///
/// @param engine    The simulation engine to populate.
/// @param scenario  Scenario data.
///
/// @throws LoaderError  If an identifier is already used in @p engine.
///
/// @see load_scenario, load_event_script, core::Engine
void inject_scenario(core::Engine& engine, const ScenarioData& scenario);

} // namespace ridesim::io
