#pragma once

#include <cstddef>
#include <unordered_set>
#include <vector>
#include <absl/container/flat_hash_set.h>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>

// Choose Abseil or std hash set
#if USE_ABSEIL_HASH_SET
template<typename T>
using HashSet = absl::flat_hash_set<T>;
#else
template<typename T>
using HashSet = std::unordered_set<T>;
#endif

namespace bg = boost::geometry;

// ==================== Structures ====================

// A geographic point in decimal degrees. Always built and read as {lat, lon};
// Boost.Geometry sees it as a spherical point with longitude first.
struct Waypoint {
    double lat;
    double lon;

    bool operator==(const Waypoint& other) const {
        return lat == other.lat && lon == other.lon;
    }
    bool operator!=(const Waypoint& other) const { return !(*this == other); }
};

BOOST_GEOMETRY_REGISTER_POINT_2D(Waypoint, double,
    boost::geometry::cs::spherical_equatorial<boost::geometry::degree>, lon, lat)

// Pairwise distances in kilometers, matrix[i][j] == matrix[j][i], zero diagonal
typedef std::vector<std::vector<double>> DistanceMatrix;

// Undirected tree edge. `from` was already in the tree when the edge was chosen.
struct Edge {
    size_t from, to;
    double weight;
};

typedef std::vector<Edge> SpanningTree;
typedef std::vector<size_t> VisitingOrder;
typedef std::vector<Waypoint> Polyline;

// Where a distance or geometry came from
enum class DistanceSource {
    RoutingService,
    Fallback
};

// Final output of one planning run
struct RoutePlan {
    VisitingOrder visitingOrder;
    std::vector<Waypoint> routeCoords;  // waypoints in visiting order
    double totalDistance = 0.0;         // km, rounded to 2 decimals
    std::vector<Polyline> roadSegments; // N-1 segments in visiting order
    std::vector<DistanceSource> segmentSources;
};
