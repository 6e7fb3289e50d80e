#pragma once

#include <memory>
#include <optional>

#include "structures.hpp"

// ==================== Distance provider ====================

// A road-routing collaborator. Implementations return nullopt on any
// failure and must be safe to call from several threads at once.
class RoutingService {
public:
    virtual ~RoutingService() = default;

    // Driving distance in km. NaN, infinite or negative values count as failures.
    virtual std::optional<double> routeDistance(const Waypoint& from, const Waypoint& to) const = 0;

    // Driving path from `from` to `to`
    virtual std::optional<Polyline> routeGeometry(const Waypoint& from, const Waypoint& to) const = 0;
};

struct DistanceResult {
    double km;
    DistanceSource source;
};

struct GeometryResult {
    Polyline path;
    DistanceSource source;
};

// Resolves distances and paths between waypoints, preferring the routing
// service and falling back to haversine / straight line when it fails.
// Without a service every call takes the fallback.
class DistanceProvider {
public:
    explicit DistanceProvider(std::shared_ptr<const RoutingService> service = nullptr);

    DistanceResult distance(const Waypoint& a, const Waypoint& b) const;
    GeometryResult geometry(const Waypoint& a, const Waypoint& b) const;

    bool hasRoutingService() const { return service_ != nullptr; }

private:
    std::shared_ptr<const RoutingService> service_;
};

const char* toString(DistanceSource source);
