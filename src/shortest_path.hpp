#pragma once

#include <cstddef>
#include <vector>

#include "structures.hpp"
#include "graph.hpp"

// ==================== Shortest paths ====================

struct ShortestPath {
    std::vector<size_t> path; // start .. end, empty if unreachable
    double distance;          // infinity if unreachable
};

// Dijkstra from start to end using a linear scan for the next vertex (no heap).
// Stops as soon as `end` is selected. Throws std::out_of_range for bad vertices.
ShortestPath dijkstra(const WeightedGraph& graph, size_t start, size_t end);

// Sum of shortest-path distances between consecutive vertices of the order,
// rounded to 2 decimals.
double accumulatePathCost(const WeightedGraph& graph, const VisitingOrder& order);

// Round half away from zero to 2 decimals
double roundToCents(double km);
