#include <iostream>
#include <limits>
#include <numbers>
#include <vector>

#include "geometry.hpp"
#include "check.hpp"

int main() {
    std::vector<Waypoint> points = {
        {0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {48.8566, 2.3522},
        {51.5074, -0.1278}, {-33.8688, 151.2093}, {89.9, 179.9}
    };

    // Symmetric, zero only on identical points
    for (size_t i = 0; i < points.size(); ++i) {
        CHECK_NEAR(haversineDistance(points[i], points[i]), 0.0, 1e-9);
        for (size_t j = i + 1; j < points.size(); ++j) {
            double ab = haversineDistance(points[i], points[j]);
            double ba = haversineDistance(points[j], points[i]);
            CHECK_NEAR(ab, ba, 1e-9);
            CHECK(ab > 0.0);
        }
    }

    // One degree along the equator or a meridian
    double degree = EARTH_RADIUS_KM * std::numbers::pi / 180.0;
    CHECK_NEAR(haversineDistance({0.0, 0.0}, {0.0, 1.0}), degree, 1e-6);
    CHECK_NEAR(haversineDistance({0.0, 0.0}, {1.0, 0.0}), degree, 1e-6);
    CHECK_NEAR(haversineDistance({0.0, 0.0}, {0.0, 1.0}), 111.19, 0.005);

    // Paris - London, about 344 km
    CHECK_NEAR(haversineDistance(points[3], points[4]), 343.5, 1.0);

    // Fallback geometry is exactly the two endpoints
    Polyline line = straightLine(points[3], points[4]);
    CHECK(line.size() == 2);
    CHECK(line[0] == points[3]);
    CHECK(line[1] == points[4]);
    CHECK_NEAR(polylineLength(line), haversineDistance(points[3], points[4]), 1e-9);
    CHECK_NEAR(polylineLength({points[0], points[1], points[2]}),
               haversineDistance(points[0], points[1]) + haversineDistance(points[1], points[2]), 1e-9);
    CHECK_NEAR(polylineLength({}), 0.0, 0.0);

    // Coordinate ranges
    CHECK(isValidWaypoint({90.0, 180.0}));
    CHECK(isValidWaypoint({-90.0, -180.0}));
    CHECK(!isValidWaypoint({90.5, 0.0}));
    CHECK(!isValidWaypoint({0.0, -180.5}));
    CHECK(!isValidWaypoint({std::numeric_limits<double>::quiet_NaN(), 0.0}));

    return TEST_RESULT("GeometryTest");
}
