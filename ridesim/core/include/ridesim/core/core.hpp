#pragma once

/// @defgroup core Core Library
/// @brief Simulation engine, entities, dispatcher, events, and types.
///
/// The core library provides the ride-matching simulation itself: the
/// event-driven Engine, the Rider and Driver entities, the Dispatcher
/// and its nearest-driver matching, and the event state machine. It has
/// no dependencies on input formats or statistics.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Ticks, grid locations, distance and travel time.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Event-driven simulation loop.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Event types, ordering key and event queue.

// Convenience header for the core library
#include <ridesim/core/types.hpp>
#include <ridesim/core/error.hpp>
#include <ridesim/core/notifier.hpp>
#include <ridesim/core/trace_writer.hpp>

#include <ridesim/core/rider.hpp>
#include <ridesim/core/driver.hpp>
#include <ridesim/core/event.hpp>
#include <ridesim/core/event_queue.hpp>
#include <ridesim/core/dispatcher.hpp>

#include <ridesim/core/engine.hpp>
