#pragma once

#include <stdexcept>
#include <string>

namespace ridesim::core {

/// @brief Base exception for all simulation errors.
///
/// Every exception thrown by the core library derives from this class,
/// so callers can catch simulation failures separately from other
/// `std::runtime_error` exceptions.
///
/// @see InvalidStateError, EmptyQueueError, DuplicateIdError
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, starting a drive with a driver that is already en route,
/// cancelling a rider that was already picked up, or scheduling an event
/// before the current simulation time.
///
/// @see SimulationError
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a driver already serving a rider is matched again.
///
/// Only reachable with MatchPolicy::KeepIdle, which leaves matched
/// drivers in the idle partition.
///
/// @see MatchPolicy
/// @ingroup core
class DoubleBookingError : public InvalidStateError {
public:
    using InvalidStateError::InvalidStateError;
};

/// @brief Thrown when removing from an event queue that holds no events.
///
/// The engine checks for emptiness before every removal, so this only
/// surfaces from direct misuse of EventQueue.
///
/// @see EventQueue::remove_min
/// @ingroup core
class EmptyQueueError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when registering a rider or driver whose identifier is taken.
///
/// @see Engine::add_rider, Engine::add_driver
/// @ingroup core
class DuplicateIdError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace ridesim::core
