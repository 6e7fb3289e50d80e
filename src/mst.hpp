#pragma once

#include "structures.hpp"
#include "graph.hpp"

// ==================== Spanning tree ====================

// Prim's algorithm starting from vertex 0, without a priority queue: every
// round scans all edges leaving the visited set and takes the cheapest one.
// Ties go to the edge found first (visited vertices in the order they joined,
// then neighbor-list order). O(n^3), fine for tens of waypoints.
//
// Stops early if no edge leaves the visited set, so a disconnected graph
// yields fewer than n-1 edges instead of looping forever.
SpanningTree primMST(const WeightedGraph& graph);

// Sum of edge weights
double treeWeight(const SpanningTree& tree);

// True if the tree has n-1 edges, no cycles and touches every vertex
bool isSpanningTree(const SpanningTree& tree, size_t numVertices);
