#include "tour.hpp"
#include "debug.hpp"

#include <stack>
#include <stdexcept>
#include <string>
#include <vector>

VisitingOrder dfsOrder(const SpanningTree& tree, size_t numVertices, size_t start) {
    if (start >= numVertices) {
        throw std::out_of_range("DFS start vertex " + std::to_string(start)
                                + " outside tree of " + std::to_string(numVertices) + " vertices");
    }

    // Build adjacency list from tree edges
    std::vector<std::vector<size_t>> adj(numVertices);
    for (const auto& e : tree) {
        adj.at(e.from).push_back(e.to);
        adj.at(e.to).push_back(e.from);
    }

    std::vector<bool> visited(numVertices, false);
    VisitingOrder order;
    order.reserve(numVertices);

    std::stack<size_t> pending;
    pending.push(start);
    while (!pending.empty()) {
        size_t u = pending.top();
        pending.pop();
        if (visited[u]) continue;
        visited[u] = true;
        order.push_back(u);

        // Push in reverse so the first neighbor is explored first
        for (auto it = adj[u].rbegin(); it != adj[u].rend(); ++it) {
            if (!visited[*it]) pending.push(*it);
        }
    }

    DBG("DFS visited " << order.size() << " of " << numVertices << " vertices");
    return order;
}

bool isPermutation(const VisitingOrder& order, size_t n) {
    if (order.size() != n) return false;
    std::vector<bool> seen(n, false);
    for (size_t v : order) {
        if (v >= n || seen[v]) return false;
        seen[v] = true;
    }
    return true;
}
