#pragma once

#include <stdexcept>
#include <string>

namespace qcloudsim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidStateError, OutOfRangeError, ResourceError
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, scheduling an event with a negative delay, reserving a
/// qubit that is already busy, or releasing a mutex that is not held.
///
/// @see SimulationError
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example, a qubit id beyond the device's qubit count or an
/// unknown device preset name.
///
/// @see SimulationError
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown on a structural fault of a capacity resource.
///
/// Raised when a semaphore is asked for a non-positive amount, for more
/// units than its capacity can ever hold, or when a release would push
/// its level above capacity. Blocking never raises this error; only
/// requests that can never be satisfied do.
///
/// @see Semaphore, SimulationError
/// @ingroup core
class ResourceError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace qcloudsim::core
