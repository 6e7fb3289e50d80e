#pragma once

#include <cstddef>

#include "structures.hpp"

// ==================== Tour sequencing ====================

// Depth-first preorder of the tree from `start`. Neighbors are explored in the
// order their edges appear in the tree. Uses an explicit stack, so deep trees
// don't exhaust the call stack; the order matches the recursive walk.
// Throws std::out_of_range if start >= numVertices.
VisitingOrder dfsOrder(const SpanningTree& tree, size_t numVertices, size_t start = 0);

// True if order is a permutation of 0..n-1
bool isPermutation(const VisitingOrder& order, size_t n);
