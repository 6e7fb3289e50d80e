#pragma once

#include <cstddef>
#include <vector>

#include "structures.hpp"
#include "distance_provider.hpp"

struct PlannerOptions {
    size_t maxConcurrentRequests = 8; // bound on in-flight routing requests
};

// Rejects inputs the planner must not be called with: fewer than 2 waypoints
// or coordinates out of range. Throws std::invalid_argument.
void validateWaypoints(const std::vector<Waypoint>& points);

// Road geometry for every consecutive pair of the order (N-1 entries)
std::vector<GeometryResult> fetchSegmentGeometries(const std::vector<Waypoint>& points,
                                                   const VisitingOrder& order,
                                                   const DistanceProvider& provider,
                                                   size_t maxConcurrency = 8);

// Distance matrix -> complete graph -> Prim MST -> DFS order, then path cost
// and segment geometry in parallel.
//
// A single waypoint yields the trivial plan. Empty input throws
// std::invalid_argument; a spanning tree that misses vertices throws
// std::runtime_error.
RoutePlan planRoute(const std::vector<Waypoint>& points,
                    const DistanceProvider& provider,
                    const PlannerOptions& options = {});
