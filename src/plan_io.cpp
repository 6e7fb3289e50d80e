#include "plan_io.hpp"
#include "distance_provider.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

std::vector<Waypoint> parseCoordinates(const json& request) {
    if (!request.is_object()) {
        throw std::invalid_argument("Request must be a JSON object");
    }
    auto it = request.find("coordinates");
    if (it == request.end()) return {};
    if (!it->is_array()) {
        throw std::invalid_argument("\"coordinates\" must be an array of [lat, lon] pairs");
    }

    std::vector<Waypoint> points;
    points.reserve(it->size());
    for (size_t i = 0; i < it->size(); ++i) {
        const json& c = (*it)[i];
        if (!c.is_array() || c.size() != 2 || !c[0].is_number() || !c[1].is_number()) {
            throw std::invalid_argument("Coordinate " + std::to_string(i) + " is not a [lat, lon] pair");
        }
        points.push_back({c[0].get<double>(), c[1].get<double>()});
    }
    return points;
}

std::vector<Waypoint> readRequestFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open file: " + path.string());

    json request = json::parse(in, nullptr, false);
    if (request.is_discarded()) {
        throw std::invalid_argument("Request is not valid JSON: " + path.string());
    }
    return parseCoordinates(request);
}

json toJson(const Waypoint& p) {
    return json::array({p.lat, p.lon});
}

json planToJson(const RoutePlan& plan) {
    json coords = json::array();
    for (const auto& p : plan.routeCoords) coords.push_back(toJson(p));

    json segments = json::array();
    for (const auto& segment : plan.roadSegments) {
        json line = json::array();
        for (const auto& p : segment) line.push_back(toJson(p));
        segments.push_back(line);
    }

    json sources = json::array();
    for (auto s : plan.segmentSources) sources.push_back(toString(s));

    json response;
    response["success"] = true;
    response["visiting_order"] = plan.visitingOrder;
    response["route_coords"] = coords;
    response["total_distance"] = plan.totalDistance;
    response["road_segments"] = segments;
    response["segment_sources"] = sources;
    return response;
}

json invalidInputJson(const std::string& message, const std::vector<Waypoint>& points) {
    json coords = json::array();
    if (!points.empty()) coords.push_back(toJson(points[0]));

    json response;
    response["error"] = message;
    response["visiting_order"] = json::array({0});
    response["route_coords"] = coords;
    response["total_distance"] = 0;
    return response;
}

json errorJson(const std::string& message) {
    json response;
    response["error"] = message;
    response["success"] = false;
    return response;
}
