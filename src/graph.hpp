#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "structures.hpp"

// ==================== Weighted graph ====================

// (neighbor, weight)
typedef std::pair<size_t, double> Neighbor;

// Undirected weighted graph over vertices 0..n-1, stored as adjacency lists.
class WeightedGraph {
public:
    explicit WeightedGraph(size_t numVertices = 0);

    // Appends (v, w) to u's list and (u, w) to v's list.
    // Throws std::out_of_range if either vertex does not exist.
    void addEdge(size_t u, size_t v, double weight);

    const std::vector<Neighbor>& neighbors(size_t u) const;

    size_t vertexCount() const { return adj.size(); }

private:
    std::vector<std::vector<Neighbor>> adj;
};

// Complete graph with one edge per unordered pair (i < j), weights from the matrix
WeightedGraph buildCompleteGraph(const DistanceMatrix& matrix);
