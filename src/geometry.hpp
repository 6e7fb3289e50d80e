#pragma once

#include <boost/geometry.hpp>

#include "structures.hpp"

namespace bg = boost::geometry;

// Mean Earth radius used by the fallback distance
constexpr double EARTH_RADIUS_KM = 6371.0;

typedef bg::strategy::distance::haversine<double> Haversine;

// ==================== Geometry helpers ====================

// Great-circle distance in kilometers
double haversineDistance(const Waypoint& a, const Waypoint& b);

// Two-point path [a, b], used when no road geometry is available
Polyline straightLine(const Waypoint& a, const Waypoint& b);

// Sum of haversine distances along a polyline
double polylineLength(const Polyline& line);

// Latitude in [-90, 90] and longitude in [-180, 180], both finite
bool isValidWaypoint(const Waypoint& p);
