#pragma once

#include <optional>
#include <string>

#include "structures.hpp"
#include "distance_provider.hpp"

// Endpoint settings for the OSRM routing service
struct RoutingConfig {
    std::string baseUrl = "http://router.project-osrm.org";
    std::string profile = "driving";
    double timeoutSeconds = 5.0;
};

// Raw result of one HTTP GET
struct HttpResponse {
    long status;
    std::string body;
};

// ==================== OSRM wire format ====================

// /route/v1/{profile}/{lon1},{lat1};{lon2},{lat2}?... (OSRM wants lon first)
std::string osrmRouteUrl(const RoutingConfig& config, const Waypoint& from, const Waypoint& to,
                         bool fullGeometry);

// Route distance in km from an OSRM route response, or nullopt when the
// response has no usable route.
std::optional<double> parseOsrmDistance(const std::string& body);

// Route geometry from an OSRM response requested with geometries=geojson.
// Coordinates are converted from [lon, lat] to waypoints.
std::optional<Polyline> parseOsrmGeometry(const std::string& body);

// GET with a timeout. Returns nullopt on transport failure or timeout.
std::optional<HttpResponse> httpGet(const std::string& url, double timeoutSeconds);

// RoutingService backed by an OSRM HTTP endpoint
class OsrmRoutingService : public RoutingService {
public:
    explicit OsrmRoutingService(RoutingConfig config);

    std::optional<double> routeDistance(const Waypoint& from, const Waypoint& to) const override;
    std::optional<Polyline> routeGeometry(const Waypoint& from, const Waypoint& to) const override;

private:
    std::optional<std::string> fetch(const std::string& url) const;

    RoutingConfig config_;
};
