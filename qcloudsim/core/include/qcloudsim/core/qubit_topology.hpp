#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace qcloudsim::core {

/// @brief Index of a physical qubit on one device.
/// @ingroup core_topology
using QubitId = uint32_t;

/// @brief Undirected coupling between two qubits.
/// @ingroup core_topology
using QubitEdge = std::pair<QubitId, QubitId>;

/// @brief Qubit connectivity graph of one device plus its free/busy colouring.
///
/// The static edge list given at construction is kept unchanged for the
/// lifetime of the device; the live adjacency is trimmed when qubits are
/// reserved and regrown from the static list when they are released.
///
/// Node iteration order is the order of first appearance in the edge
/// list, followed by isolated qubits in ascending id. Per-node neighbour
/// lists keep insertion order, so breadth-first traversals are
/// reproducible.
///
/// Mutation goes through TopologyAllocator, which serialises it.
///
/// @see TopologyAllocator
/// @ingroup core_topology
class QubitTopology {
public:
    /// @brief Build a topology of @p num_qubits qubits.
    /// @throws OutOfRangeError if an edge names a qubit >= @p num_qubits.
    /// @throws InvalidStateError on a self-loop.
    QubitTopology(std::size_t num_qubits, std::vector<QubitEdge> edges);

    [[nodiscard]] std::size_t num_qubits() const noexcept { return busy_.size(); }
    [[nodiscard]] std::size_t free_count() const noexcept { return num_qubits() - busy_count_; }

    [[nodiscard]] bool is_free(QubitId q) const;
    [[nodiscard]] bool all_free(std::span<const QubitId> qubits) const;

    /// @brief Nodes in graph iteration order.
    [[nodiscard]] const std::vector<QubitId>& nodes() const noexcept { return node_order_; }

    /// @brief Live neighbours of @p q in insertion order.
    [[nodiscard]] const std::vector<QubitId>& neighbors(QubitId q) const;

    /// @brief The static edge list the device was built with (deduplicated).
    [[nodiscard]] const std::vector<QubitEdge>& original_edges() const noexcept {
        return original_edges_;
    }

    [[nodiscard]] bool has_edge(QubitId a, QubitId b) const;

    /// @brief Number of live edges.
    [[nodiscard]] std::size_t edge_count() const noexcept { return live_edges_; }

    /// @brief Tree edges of a breadth-first traversal from @p start, in visit order.
    ///
    /// Traverses the live graph regardless of colouring.
    [[nodiscard]] std::vector<QubitEdge> bfs_edges(QubitId start) const;

    /// @brief Ring of @p n qubits (0-1-...-(n-1)-0).
    [[nodiscard]] static QubitTopology ring(std::size_t n);
    /// @brief Path of @p n qubits.
    [[nodiscard]] static QubitTopology line(std::size_t n);
    /// @brief Rectangular lattice, row-major ids.
    [[nodiscard]] static QubitTopology grid(std::size_t rows, std::size_t cols);
    /// @brief All-to-all coupling.
    [[nodiscard]] static QubitTopology full(std::size_t n);

private:
    friend class TopologyAllocator;

    void check_qubit(QubitId q) const;
    void set_busy(QubitId q, bool busy);
    void add_edge(QubitId a, QubitId b);
    void remove_edge(QubitId a, QubitId b);

    std::vector<QubitEdge> original_edges_;
    std::vector<QubitId> node_order_;
    std::vector<std::vector<QubitId>> adjacency_;
    std::vector<bool> busy_;
    std::size_t busy_count_{0};
    std::size_t live_edges_{0};
};

} // namespace qcloudsim::core
