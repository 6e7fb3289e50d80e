#include "distance_provider.hpp"
#include "geometry.hpp"
#include "debug.hpp"

#include <cmath>
#include <utility>

DistanceProvider::DistanceProvider(std::shared_ptr<const RoutingService> service)
    : service_(std::move(service)) {}

DistanceResult DistanceProvider::distance(const Waypoint& a, const Waypoint& b) const {
    if (service_) {
        auto km = service_->routeDistance(a, b);
        if (km && std::isfinite(*km) && *km >= 0.0) {
            return {*km, DistanceSource::RoutingService};
        }
        if (km) {
            LOG("OSRM", "Rejected route distance " << *km << " for (" << a.lat << ", " << a.lon << ") -> ("
                << b.lat << ", " << b.lon << "), using haversine");
        } else {
            LOG("OSRM", "No route distance for (" << a.lat << ", " << a.lon << ") -> ("
                << b.lat << ", " << b.lon << "), using haversine");
        }
    }
    return {haversineDistance(a, b), DistanceSource::Fallback};
}

GeometryResult DistanceProvider::geometry(const Waypoint& a, const Waypoint& b) const {
    if (service_) {
        if (auto path = service_->routeGeometry(a, b)) {
            return {std::move(*path), DistanceSource::RoutingService};
        }
        LOG("OSRM", "No route geometry for (" << a.lat << ", " << a.lon << ") -> ("
            << b.lat << ", " << b.lon << "), using straight line");
    }
    return {straightLine(a, b), DistanceSource::Fallback};
}

const char* toString(DistanceSource source) {
    switch (source) {
        case DistanceSource::RoutingService: return "osrm";
        case DistanceSource::Fallback: return "fallback";
    }
    return "unknown";
}
