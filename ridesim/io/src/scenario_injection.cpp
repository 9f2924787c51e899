#include <ridesim/io/scenario_injection.hpp>
#include <ridesim/io/error.hpp>

#include <ridesim/core/driver.hpp>
#include <ridesim/core/error.hpp>
#include <ridesim/core/rider.hpp>

#include <string>
#include <variant>

namespace ridesim::io {

namespace {

struct RequestInjector {
    core::Engine& engine;

    void operator()(const RiderRequestParams& params) const {
        auto& rider = engine.add_rider(params.id, params.origin, params.destination, params.patience);
        engine.schedule_rider_request(rider, params.time);
    }

    void operator()(const DriverRequestParams& params) const {
        auto& driver = engine.add_driver(params.id, params.location, params.speed);
        engine.schedule_driver_request(driver, params.time);
    }
};

} // anonymous namespace

void inject_scenario(core::Engine& engine, const ScenarioData& scenario) {
    for (std::size_t idx = 0; idx < scenario.requests.size(); ++idx) {
        try {
            std::visit(RequestInjector{engine}, scenario.requests[idx]);
        } catch (const core::DuplicateIdError& e) {
            throw LoaderError(e.what(), "requests[" + std::to_string(idx) + "]");
        }
    }
}

} // namespace ridesim::io
