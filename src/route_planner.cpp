#include "route_planner.hpp"
#include "distance_matrix.hpp"
#include "geometry.hpp"
#include "graph.hpp"
#include "mst.hpp"
#include "parallel.hpp"
#include "shortest_path.hpp"
#include "tour.hpp"
#include "debug.hpp"

#include <future>
#include <stdexcept>
#include <string>
#include <utility>

void validateWaypoints(const std::vector<Waypoint>& points) {
    if (points.size() < 2) {
        throw std::invalid_argument("Please select at least 2 tourist spots");
    }
    for (size_t i = 0; i < points.size(); ++i) {
        if (!isValidWaypoint(points[i])) {
            throw std::invalid_argument("Waypoint " + std::to_string(i)
                                        + " is outside latitude [-90, 90] / longitude [-180, 180]");
        }
    }
}

std::vector<GeometryResult> fetchSegmentGeometries(const std::vector<Waypoint>& points,
                                                   const VisitingOrder& order,
                                                   const DistanceProvider& provider,
                                                   size_t maxConcurrency) {
    size_t segments = order.size() > 1 ? order.size() - 1 : 0;
    return runBatched<GeometryResult>(segments, maxConcurrency, [&](size_t i) {
        return provider.geometry(points.at(order[i]), points.at(order[i + 1]));
    });
}

RoutePlan planRoute(const std::vector<Waypoint>& points,
                    const DistanceProvider& provider,
                    const PlannerOptions& options) {
    if (points.empty()) {
        throw std::invalid_argument("Cannot plan a route without waypoints");
    }

    RoutePlan plan;
    if (points.size() == 1) {
        plan.visitingOrder = {0};
        plan.routeCoords = {points[0]};
        return plan;
    }

    size_t n = points.size();

    // Step 1: Pairwise distances
    DistanceMatrix matrix = buildDistanceMatrix(points, provider, options.maxConcurrentRequests);

    // Step 2: Complete graph over the waypoints
    WeightedGraph graph = buildCompleteGraph(matrix);

    // Step 3: Minimum spanning tree
    SpanningTree tree = primMST(graph);
    if (tree.size() != n - 1) {
        LOG("Planner", "Spanning tree has " << tree.size() << " edges for " << n
            << " waypoints, aborting run");
        throw std::runtime_error("Spanning tree does not connect all waypoints");
    }
    DBG("MST weight: " << treeWeight(tree) << " km");

    // Step 4: Visiting order
    plan.visitingOrder = dfsOrder(tree, n, 0);
    for (size_t v : plan.visitingOrder) {
        plan.routeCoords.push_back(points[v]);
    }

    // Step 5: Road geometry on a worker while the path cost is summed here
    auto geometries = std::async(std::launch::async, [&] {
        return fetchSegmentGeometries(points, plan.visitingOrder, provider, options.maxConcurrentRequests);
    });
    plan.totalDistance = accumulatePathCost(graph, plan.visitingOrder);

    for (auto& g : geometries.get()) {
        DBG("Segment of " << g.path.size() << " points, " << polylineLength(g.path) << " km ("
            << toString(g.source) << ")");
        plan.roadSegments.push_back(std::move(g.path));
        plan.segmentSources.push_back(g.source);
    }

    return plan;
}
