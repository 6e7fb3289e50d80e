#include "mst.hpp"
#include "debug.hpp"

#include <limits>
#include <numeric>
#include <vector>

SpanningTree primMST(const WeightedGraph& graph) {
    size_t n = graph.vertexCount();
    SpanningTree tree;
    if (n == 0) return tree;
    tree.reserve(n - 1);

    // Start with vertex 0
    HashSet<size_t> visited;
    std::vector<size_t> joinOrder;
    visited.insert(0);
    joinOrder.push_back(0);

    while (visited.size() < n) {
        bool found = false;
        Edge best{0, 0, std::numeric_limits<double>::infinity()};

        // Find minimum edge connecting visited to unvisited
        for (size_t u : joinOrder) {
            for (const auto& [v, w] : graph.neighbors(u)) {
                if (!visited.contains(v) && w < best.weight) {
                    best = {u, v, w};
                    found = true;
                }
            }
        }

        if (!found) {
            DBG("No edge leaves the visited set after " << visited.size() << " of " << n << " vertices");
            break;
        }

        tree.push_back(best);
        visited.insert(best.to);
        joinOrder.push_back(best.to);
        DBG("MST edge " << best.from << " - " << best.to << " (" << best.weight << ")");
    }

    return tree;
}

double treeWeight(const SpanningTree& tree) {
    double total = 0.0;
    for (const auto& e : tree) total += e.weight;
    return total;
}

bool isSpanningTree(const SpanningTree& tree, size_t numVertices) {
    if (numVertices == 0) return tree.empty();
    if (tree.size() != numVertices - 1) return false;

    // n-1 edges without a cycle connect all n vertices
    std::vector<size_t> parent(numVertices);
    std::iota(parent.begin(), parent.end(), 0);
    auto find = [&](size_t x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    };

    for (const auto& e : tree) {
        if (e.from >= numVertices || e.to >= numVertices) return false;
        size_t a = find(e.from), b = find(e.to);
        if (a == b) return false;
        parent[a] = b;
    }
    return true;
}
