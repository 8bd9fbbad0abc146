#pragma once

#include <qcloudsim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <functional>

namespace qcloudsim::core {

/// @brief Deterministic ordering key for events in the queue.
///
/// Events are ordered first by simulation time, then by insertion
/// sequence number. Two runs that submit the same events in the same
/// order therefore replay identically.
///
/// @see Engine::schedule
/// @ingroup core_events
struct EventKey {
    TimePoint time;      ///< Primary: simulation time at which the event fires.
    uint64_t sequence;   ///< Secondary: insertion order for determinism.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief A pending resumption of a suspended process.
///
/// The continuation is the code that follows the process's suspension
/// point (a timeout, a mutex grant or a semaphore grant).
///
/// @ingroup core_events
struct Event {
    std::function<void()> continuation; ///< Invoked when the event fires.
};

} // namespace qcloudsim::core
