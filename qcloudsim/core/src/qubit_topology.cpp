#include <qcloudsim/core/qubit_topology.hpp>
#include <qcloudsim/core/error.hpp>

#include <algorithm>
#include <deque>
#include <string>

namespace qcloudsim::core {

QubitTopology::QubitTopology(std::size_t num_qubits, std::vector<QubitEdge> edges)
    : adjacency_(num_qubits)
    , busy_(num_qubits, false) {
    std::vector<bool> seen(num_qubits, false);
    auto visit = [&](QubitId q) {
        if (!seen[q]) {
            seen[q] = true;
            node_order_.push_back(q);
        }
    };

    for (const auto& [a, b] : edges) {
        check_qubit(a);
        check_qubit(b);
        if (a == b) {
            throw InvalidStateError("Self-loop on qubit " + std::to_string(a));
        }
        visit(a);
        visit(b);
        if (!has_edge(a, b)) {
            original_edges_.emplace_back(a, b);
            add_edge(a, b);
        }
    }
    for (QubitId q = 0; q < num_qubits; ++q) {
        visit(q);
    }
}

void QubitTopology::check_qubit(QubitId q) const {
    if (q >= busy_.size()) {
        throw OutOfRangeError("Qubit " + std::to_string(q) + " out of range (device has " +
                              std::to_string(busy_.size()) + " qubits)");
    }
}

bool QubitTopology::is_free(QubitId q) const {
    check_qubit(q);
    return !busy_[q];
}

bool QubitTopology::all_free(std::span<const QubitId> qubits) const {
    return std::all_of(qubits.begin(), qubits.end(), [this](QubitId q) { return is_free(q); });
}

const std::vector<QubitId>& QubitTopology::neighbors(QubitId q) const {
    check_qubit(q);
    return adjacency_[q];
}

bool QubitTopology::has_edge(QubitId a, QubitId b) const {
    check_qubit(a);
    check_qubit(b);
    const auto& adj = adjacency_[a];
    return std::find(adj.begin(), adj.end(), b) != adj.end();
}

std::vector<QubitEdge> QubitTopology::bfs_edges(QubitId start) const {
    check_qubit(start);
    std::vector<QubitEdge> tree;
    std::vector<bool> visited(num_qubits(), false);
    std::deque<QubitId> frontier{start};
    visited[start] = true;

    while (!frontier.empty()) {
        QubitId current = frontier.front();
        frontier.pop_front();
        for (QubitId next : adjacency_[current]) {
            if (!visited[next]) {
                visited[next] = true;
                tree.emplace_back(current, next);
                frontier.push_back(next);
            }
        }
    }
    return tree;
}

void QubitTopology::set_busy(QubitId q, bool busy) {
    if (busy_[q] != busy) {
        busy_[q] = busy;
        if (busy) {
            ++busy_count_;
        } else {
            --busy_count_;
        }
    }
}

void QubitTopology::add_edge(QubitId a, QubitId b) {
    if (has_edge(a, b)) {
        return;
    }
    adjacency_[a].push_back(b);
    adjacency_[b].push_back(a);
    ++live_edges_;
}

void QubitTopology::remove_edge(QubitId a, QubitId b) {
    auto erase = [](std::vector<QubitId>& adj, QubitId q) {
        auto it = std::find(adj.begin(), adj.end(), q);
        if (it == adj.end()) {
            return false;
        }
        adj.erase(it);
        return true;
    };
    if (erase(adjacency_[a], b)) {
        erase(adjacency_[b], a);
        --live_edges_;
    }
}

QubitTopology QubitTopology::ring(std::size_t n) {
    std::vector<QubitEdge> edges;
    for (std::size_t i = 0; i + 1 < n; ++i) {
        edges.emplace_back(static_cast<QubitId>(i), static_cast<QubitId>(i + 1));
    }
    if (n > 2) {
        edges.emplace_back(static_cast<QubitId>(n - 1), 0);
    }
    return QubitTopology{n, std::move(edges)};
}

QubitTopology QubitTopology::line(std::size_t n) {
    std::vector<QubitEdge> edges;
    for (std::size_t i = 0; i + 1 < n; ++i) {
        edges.emplace_back(static_cast<QubitId>(i), static_cast<QubitId>(i + 1));
    }
    return QubitTopology{n, std::move(edges)};
}

QubitTopology QubitTopology::grid(std::size_t rows, std::size_t cols) {
    std::vector<QubitEdge> edges;
    auto id = [cols](std::size_t r, std::size_t c) { return static_cast<QubitId>(r * cols + c); };
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            if (c + 1 < cols) {
                edges.emplace_back(id(r, c), id(r, c + 1));
            }
            if (r + 1 < rows) {
                edges.emplace_back(id(r, c), id(r + 1, c));
            }
        }
    }
    return QubitTopology{rows * cols, std::move(edges)};
}

QubitTopology QubitTopology::full(std::size_t n) {
    std::vector<QubitEdge> edges;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            edges.emplace_back(static_cast<QubitId>(i), static_cast<QubitId>(j));
        }
    }
    return QubitTopology{n, std::move(edges)};
}

} // namespace qcloudsim::core
