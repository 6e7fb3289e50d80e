#include "geometry.hpp"

#include <cmath>

double haversineDistance(const Waypoint& a, const Waypoint& b) {
    return bg::distance(a, b, Haversine(EARTH_RADIUS_KM));
}

Polyline straightLine(const Waypoint& a, const Waypoint& b) {
    return {a, b};
}

double polylineLength(const Polyline& line) {
    double total = 0.0;
    for (size_t i = 1; i < line.size(); ++i) {
        total += haversineDistance(line[i - 1], line[i]);
    }
    return total;
}

bool isValidWaypoint(const Waypoint& p) {
    if (!std::isfinite(p.lat) || !std::isfinite(p.lon)) return false;
    return p.lat >= -90.0 && p.lat <= 90.0 && p.lon >= -180.0 && p.lon <= 180.0;
}
