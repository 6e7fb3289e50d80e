#include <atomic>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "distance_provider.hpp"
#include "geometry.hpp"
#include "osrm_client.hpp"
#include "route_planner.hpp"
#include "check.hpp"

// Routing service that never answers
class UnavailableService : public RoutingService {
public:
    std::optional<double> routeDistance(const Waypoint&, const Waypoint&) const override {
        ++calls;
        return std::nullopt;
    }
    std::optional<Polyline> routeGeometry(const Waypoint&, const Waypoint&) const override {
        ++calls;
        return std::nullopt;
    }
    mutable std::atomic<int> calls{0};
};

// Routing service with canned answers: 1.5x the great-circle distance and a
// three point path through the midpoint
class CannedService : public RoutingService {
public:
    std::optional<double> routeDistance(const Waypoint& a, const Waypoint& b) const override {
        return 1.5 * haversineDistance(a, b);
    }
    std::optional<Polyline> routeGeometry(const Waypoint& a, const Waypoint& b) const override {
        return Polyline{a, {(a.lat + b.lat) / 2.0, (a.lon + b.lon) / 2.0}, b};
    }
};

// Routing service that answers every distance with the same value
class FixedDistanceService : public RoutingService {
public:
    explicit FixedDistanceService(double km) : km_(km) {}
    std::optional<double> routeDistance(const Waypoint&, const Waypoint&) const override {
        return km_;
    }
    std::optional<Polyline> routeGeometry(const Waypoint&, const Waypoint&) const override {
        return std::nullopt;
    }

private:
    double km_;
};

const std::string okDistance = R"({"code":"Ok","routes":[{"distance":12345.6,"duration":900.1}],"waypoints":[]})";
const std::string okGeometry = R"({
    "code": "Ok",
    "routes": [{
        "distance": 2500.0,
        "geometry": {"type": "LineString", "coordinates": [[13.38, 52.51], [13.39, 52.52], [13.40, 52.53]]}
    }]
})";

void testFallback() {
    Waypoint a{0.0, 0.0}, b{0.0, 1.0};

    // No service configured
    DistanceProvider offline;
    CHECK(!offline.hasRoutingService());
    DistanceResult d = offline.distance(a, b);
    CHECK(d.source == DistanceSource::Fallback);
    CHECK_NEAR(d.km, haversineDistance(a, b), 1e-12);

    // Service configured but failing
    auto unavailable = std::make_shared<UnavailableService>();
    DistanceProvider failing(unavailable);
    d = failing.distance(a, b);
    CHECK(d.source == DistanceSource::Fallback);
    CHECK_NEAR(d.km, haversineDistance(a, b), 1e-12);

    GeometryResult g = failing.geometry(a, b);
    CHECK(g.source == DistanceSource::Fallback);
    CHECK(g.path.size() == 2);
    CHECK(g.path[0] == a);
    CHECK(g.path[1] == b);
    CHECK(unavailable->calls == 2);
}

void testRoutingServicePath() {
    Waypoint a{52.51, 13.38}, b{52.53, 13.40};
    DistanceProvider provider(std::make_shared<CannedService>());

    DistanceResult d = provider.distance(a, b);
    CHECK(d.source == DistanceSource::RoutingService);
    CHECK_NEAR(d.km, 1.5 * haversineDistance(a, b), 1e-12);

    GeometryResult g = provider.geometry(a, b);
    CHECK(g.source == DistanceSource::RoutingService);
    CHECK(g.path.size() == 3);
    CHECK(g.path.front() == a);
    CHECK(g.path.back() == b);
    CHECK(std::string(toString(g.source)) == "osrm");
    CHECK(std::string(toString(DistanceSource::Fallback)) == "fallback");
}

void testRejectedServiceDistances() {
    Waypoint a{0.0, 0.0}, b{0.0, 1.0};
    const std::vector<Waypoint> points{{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}};
    RoutePlan expected = planRoute(points, DistanceProvider());

    for (double bad : {std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity(), -5.0}) {
        DistanceProvider provider(std::make_shared<FixedDistanceService>(bad));
        DistanceResult d = provider.distance(a, b);
        CHECK(d.source == DistanceSource::Fallback);
        CHECK_NEAR(d.km, haversineDistance(a, b), 1e-12);

        RoutePlan plan = planRoute(points, provider);
        CHECK(plan.totalDistance >= 0.0);
        CHECK_NEAR(plan.totalDistance, expected.totalDistance, 1e-9);
        CHECK(plan.visitingOrder == expected.visitingOrder);
    }

    // Zero is a legitimate answer for coincident points
    DistanceProvider zero(std::make_shared<FixedDistanceService>(0.0));
    CHECK(zero.distance(a, a).source == DistanceSource::RoutingService);
}

void testOsrmWireFormat() {
    RoutingConfig config;
    config.baseUrl = "http://localhost:5000";
    Waypoint from{52.517037, 13.388860}, to{52.529407, 13.397634};

    // OSRM wants lon,lat
    CHECK(osrmRouteUrl(config, from, to, false)
          == "http://localhost:5000/route/v1/driving/13.38886,52.517037;13.397634,52.529407?overview=false");
    config.profile = "foot";
    CHECK(osrmRouteUrl(config, from, to, true)
          == "http://localhost:5000/route/v1/foot/13.38886,52.517037;13.397634,52.529407?overview=full&geometries=geojson");

    auto km = parseOsrmDistance(okDistance);
    CHECK(km.has_value());
    if (km) CHECK_NEAR(*km, 12.3456, 1e-9);

    auto path = parseOsrmGeometry(okGeometry);
    CHECK(path.has_value());
    if (path) {
        CHECK(path->size() == 3);
        CHECK((*path)[0] == (Waypoint{52.51, 13.38}));
        CHECK((*path)[2] == (Waypoint{52.53, 13.40}));
    }

    // Unusable responses
    CHECK(!parseOsrmDistance(R"({"code":"NoRoute","message":"Impossible route","routes":[]})"));
    CHECK(!parseOsrmDistance(R"({"code":"Ok","routes":[]})"));
    CHECK(!parseOsrmDistance(R"({"code":"Ok"})"));
    CHECK(!parseOsrmDistance(R"({"code":"Ok","routes":[{"duration":3.0}]})"));
    CHECK(!parseOsrmDistance(R"({"code":"Ok","routes":[{"distance":"far"}]})"));
    CHECK(!parseOsrmDistance("<html>502 Bad Gateway</html>"));
    CHECK(!parseOsrmDistance(""));
    CHECK(!parseOsrmGeometry(okDistance)); // overview=false has no geometry
    CHECK(!parseOsrmGeometry(R"({"code":"Ok","routes":[{"geometry":{"coordinates":[[1.0]]}}]})"));
    CHECK(!parseOsrmGeometry(R"({"code":"Ok","routes":[{"geometry":{"coordinates":[["a","b"]]}}]})"));
    CHECK(!parseOsrmGeometry(R"({"code":"Ok","routes":[{"geometry":"_p~iF~ps|U_ulLnnqC"}]})"));
}

void testUnreachableEndpoint() {
    // Nothing listens on the discard port; the request fails fast and falls back
    RoutingConfig config;
    config.baseUrl = "http://127.0.0.1:9";
    config.timeoutSeconds = 2.0;
    auto service = std::make_shared<OsrmRoutingService>(config);
    CHECK(!service->routeDistance({0.0, 0.0}, {0.0, 1.0}));

    DistanceProvider provider(service);
    Waypoint a{0.0, 0.0}, b{0.0, 1.0};
    DistanceResult d = provider.distance(a, b);
    CHECK(d.source == DistanceSource::Fallback);
    CHECK_NEAR(d.km, haversineDistance(a, b), 1e-12);

    GeometryResult g = provider.geometry(a, b);
    CHECK(g.source == DistanceSource::Fallback);
    CHECK(g.path == straightLine(a, b));
}

int main() {
    testFallback();
    testRoutingServicePath();
    testRejectedServiceDistances();
    testOsrmWireFormat();
    testUnreachableEndpoint();
    return TEST_RESULT("DistanceProviderTest");
}
