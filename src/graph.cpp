#include "graph.hpp"

#include <stdexcept>
#include <string>

WeightedGraph::WeightedGraph(size_t numVertices) : adj(numVertices) {}

void WeightedGraph::addEdge(size_t u, size_t v, double weight) {
    if (u >= adj.size() || v >= adj.size()) {
        throw std::out_of_range("Edge (" + std::to_string(u) + ", " + std::to_string(v)
                                + ") outside graph of " + std::to_string(adj.size()) + " vertices");
    }
    adj[u].emplace_back(v, weight);
    adj[v].emplace_back(u, weight);
}

const std::vector<Neighbor>& WeightedGraph::neighbors(size_t u) const {
    return adj.at(u);
}

WeightedGraph buildCompleteGraph(const DistanceMatrix& matrix) {
    WeightedGraph graph(matrix.size());
    for (size_t i = 0; i < matrix.size(); ++i) {
        for (size_t j = i + 1; j < matrix.size(); ++j) {
            graph.addEdge(i, j, matrix[i][j]);
        }
    }
    return graph;
}
