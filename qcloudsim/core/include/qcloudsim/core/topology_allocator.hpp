#pragma once

#include <qcloudsim/core/qubit_topology.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace qcloudsim::core {

/// @brief Finds, reserves and releases qubit subsets on device topologies.
///
/// One allocator instance is shared by every quantum device of a
/// simulation. All three operations run inside a single critical section
/// spanning all devices, taken with a scoped lock so it is released on
/// every exit path including exceptions. release() rebuilds edges from
/// the current colouring of the whole device, so it must never interleave
/// with another allocation step.
///
/// @see QubitTopology
/// @ingroup core_topology
class TopologyAllocator {
public:
    TopologyAllocator() = default;

    TopologyAllocator(const TopologyAllocator&) = delete;
    TopologyAllocator& operator=(const TopologyAllocator&) = delete;

    /// @brief Pick @p n free qubits reachable from a common start.
    ///
    /// Free qubits are tried as start points in graph iteration order.
    /// From each start, a breadth-first traversal of the live graph
    /// (through busy qubits as well) adds every discovered free qubit
    /// until @p n are collected. The first start that yields exactly @p n
    /// wins. The chosen qubits are reachable from the start but are not
    /// guaranteed to be pairwise connected among themselves.
    ///
    /// @return The qubits in discovery order, or std::nullopt if no start
    ///         point reaches @p n free qubits. Never a partial set.
    [[nodiscard]] std::optional<std::vector<QubitId>> select(const QubitTopology& topology,
                                                             std::size_t n) const;

    /// @brief Mark @p qubits busy and cut their edges to the rest of the device.
    ///
    /// Edges with both endpoints inside @p qubits are kept.
    /// @throws InvalidStateError if a qubit is already busy or listed twice.
    void reserve(QubitTopology& topology, std::span<const QubitId> qubits);

    /// @brief Mark @p qubits free and restore original edges between free qubits.
    ///
    /// Every static edge whose endpoints are both free after the update
    /// is re-added, including edges cut by other reservations.
    /// @throws InvalidStateError if a qubit is not busy.
    void release(QubitTopology& topology, std::span<const QubitId> qubits);

private:
    mutable std::mutex mutex_;
};

} // namespace qcloudsim::core
