#pragma once

/// @defgroup io I/O Library
/// @brief Scenario loading, trace output and run statistics.
///
/// The I/O library handles everything around the core simulation:
/// reading event scripts and JSON scenarios, writing simulation traces
/// (JSON, textual, in-memory), and recording activities into the
/// summary report. Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Event script and JSON scenario loaders.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual and memory trace writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Activity monitor and run report.

// Convenience header for the I/O library

#include <ridesim/io/error.hpp>
#include <ridesim/io/trace_writers.hpp>
#include <ridesim/io/scenario_loader.hpp>
#include <ridesim/io/event_script.hpp>
#include <ridesim/io/scenario_injection.hpp>
#include <ridesim/io/monitor.hpp>
#include <ridesim/io/simulation.hpp>
