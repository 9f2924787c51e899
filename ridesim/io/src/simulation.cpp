#include <ridesim/io/simulation.hpp>
#include <ridesim/io/scenario_injection.hpp>

#include <ridesim/core/engine.hpp>

namespace ridesim::io {

Report run_simulation(const ScenarioData& scenario, const SimulationOptions& options) {
    Monitor monitor;
    core::Engine engine(monitor, options.policy);
    engine.set_trace_writer(options.trace_writer);

    inject_scenario(engine, scenario);

    if (options.until) {
        engine.run(*options.until);
    } else {
        engine.run();
    }
    return monitor.report();
}

} // namespace ridesim::io
