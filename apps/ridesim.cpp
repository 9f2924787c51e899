#include <ridesim/core/dispatcher.hpp>
#include <ridesim/core/engine.hpp>
#include <ridesim/core/error.hpp>

#include <ridesim/io/error.hpp>
#include <ridesim/io/event_script.hpp>
#include <ridesim/io/monitor.hpp>
#include <ridesim/io/scenario_injection.hpp>
#include <ridesim/io/scenario_loader.hpp>
#include <ridesim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace core = ridesim::core;
namespace io = ridesim::io;

struct Config {
    std::string input_file;
    std::string match_policy{"reserve"};
    std::optional<core::TimePoint> until;
    std::string output_file{"-"};
    std::string format{"text"};
    std::string report_file{"-"};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("ridesim", "Ride-sharing dispatch simulator");

    options.add_options()
        ("i,input", "Event script (.txt) or scenario (.json)", cxxopts::value<std::string>())
        ("match-policy", "Matching: reserve|keep-idle (default: reserve; keep-idle stops on double booking)", cxxopts::value<std::string>()->default_value("reserve"))
        ("u,until", "Stop after this tick (default: run until no events remain)", cxxopts::value<uint64_t>())
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Trace format: text|json|none (default: text)", cxxopts::value<std::string>()->default_value("text"))
        ("r,report", "Report output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.input_file = result["input"].as<std::string>();
    config.match_policy = result["match-policy"].as<std::string>();
    if (result.count("until") != 0U) {
        config.until = result["until"].as<uint64_t>();
    }
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.report_file = result["report"].as<std::string>();
    config.verbose = result.count("verbose") != 0U;

    if (config.match_policy != "reserve" && config.match_policy != "keep-idle") {
        std::cerr << "Error: unknown match policy: " << config.match_policy << std::endl;
        std::exit(64);
    }
    if (config.format != "text" && config.format != "json" && config.format != "none") {
        std::cerr << "Error: unknown trace format: " << config.format << std::endl;
        std::exit(64);
    }

    return config;
}

io::ScenarioData load_input(const std::filesystem::path& path) {
    if (path.extension() == ".json") {
        return io::load_scenario(path);
    }
    return io::load_event_script(path);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading requests from: " << config.input_file << std::endl;
        }

        // 1. Load the initial requests
        auto scenario = load_input(config.input_file);

        // 2. Create engine and inject the requests
        io::Monitor monitor;
        auto policy = config.match_policy == "keep-idle" ? core::MatchPolicy::KeepIdle
                                                         : core::MatchPolicy::Reserve;
        core::Engine engine(monitor, policy);
        io::inject_scenario(engine, scenario);

        // 3. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream outfile;
        std::ostream* trace_out = &std::cout;

        if (config.format != "none" && config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            trace_out = &outfile;
        }
        if (config.format == "json") {
            writer = std::make_unique<io::JsonTraceWriter>(*trace_out);
        } else if (config.format == "text") {
            writer = std::make_unique<io::TextualTraceWriter>(*trace_out);
        }
        engine.set_trace_writer(writer.get());

        if (config.verbose) {
            std::cerr << "Starting simulation with " << engine.rider_count() << " riders and "
                      << engine.driver_count() << " drivers..." << std::endl;
        }

        // 4. Run simulation
        if (config.until) {
            engine.run(*config.until);
        } else {
            engine.run();
        }

        // 5. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.verbose) {
            std::cerr << "Simulation complete at time " << engine.time() << " after "
                      << engine.processed_events() << " events" << std::endl;
            std::cerr << engine.dispatcher() << std::endl;
            std::cerr << monitor << std::endl;
        }

        // 6. Report
        if (config.report_file == "-") {
            io::write_report_to_stream(monitor.report(), std::cout);
        } else {
            std::ofstream report_out(config.report_file);
            if (!report_out) {
                std::cerr << "Error: cannot open report file: " << config.report_file << std::endl;
                return 1;
            }
            io::write_report_to_stream(monitor.report(), report_out);
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::SimulationError& e) {
        std::cerr << "Simulation failed: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
