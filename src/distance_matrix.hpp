#pragma once

#include <cstddef>
#include <vector>

#include "structures.hpp"
#include "distance_provider.hpp"

// ==================== Distance matrix ====================

// Queries the provider once per unordered pair (i < j) and mirrors the value.
// Pairs are dispatched concurrently, at most maxConcurrency at a time.
DistanceMatrix buildDistanceMatrix(const std::vector<Waypoint>& points,
                                   const DistanceProvider& provider,
                                   size_t maxConcurrency = 8);

// True if the matrix is square, symmetric, non-negative and zero on the diagonal
bool isValidDistanceMatrix(const DistanceMatrix& matrix, double eps = 1e-9);
