#include <qcloudsim/core/topology_allocator.hpp>
#include <qcloudsim/core/error.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

#include <string>

namespace qcloudsim::core {

std::optional<std::vector<QubitId>> TopologyAllocator::select(const QubitTopology& topology,
                                                              std::size_t n) const {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    std::scoped_lock lock(mutex_);

    if (n == 0 || topology.free_count() < n) {
        return std::nullopt;
    }

    for (QubitId start : topology.nodes()) {
        if (!topology.is_free(start)) {
            continue;
        }

        std::vector<QubitId> selected{start};
        std::vector<bool> taken(topology.num_qubits(), false);
        taken[start] = true;

        for (const auto& [from, to] : topology.bfs_edges(start)) {
            if (selected.size() >= n) {
                break;
            }
            if (topology.is_free(to) && !taken[to]) {
                taken[to] = true;
                selected.push_back(to);
            }
        }

        if (selected.size() == n) {
            return selected;
        }
    }
    return std::nullopt;
}

void TopologyAllocator::reserve(QubitTopology& topology, std::span<const QubitId> qubits) {
    std::scoped_lock lock(mutex_);

    std::vector<bool> reserved(topology.num_qubits(), false);
    for (QubitId q : qubits) {
        if (!topology.is_free(q) || reserved[q]) {
            throw InvalidStateError("Qubit " + std::to_string(q) + " is already reserved");
        }
        reserved[q] = true;
    }

    for (QubitId q : qubits) {
        topology.set_busy(q, true);
    }
    for (QubitId q : qubits) {
        // Copy: remove_edge mutates the neighbour list being walked
        const std::vector<QubitId> neighbors = topology.neighbors(q);
        for (QubitId nb : neighbors) {
            if (!reserved[nb]) {
                topology.remove_edge(q, nb);
            }
        }
    }
}

void TopologyAllocator::release(QubitTopology& topology, std::span<const QubitId> qubits) {
    std::scoped_lock lock(mutex_);

    for (QubitId q : qubits) {
        if (topology.is_free(q)) {
            throw InvalidStateError("Qubit " + std::to_string(q) + " is not reserved");
        }
    }
    for (QubitId q : qubits) {
        topology.set_busy(q, false);
    }
    for (const auto& [a, b] : topology.original_edges()) {
        if (!topology.busy_[a] && !topology.busy_[b]) {
            topology.add_edge(a, b);
        }
    }
}

} // namespace qcloudsim::core
