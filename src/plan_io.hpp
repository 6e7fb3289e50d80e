#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "structures.hpp"

// ==================== Request / response JSON ====================

// {"coordinates": [[lat, lon], ...]} -> waypoints. A missing key is an empty
// list; anything else malformed throws std::invalid_argument.
std::vector<Waypoint> parseCoordinates(const nlohmann::json& request);

// Reads and parses a request file. Throws std::runtime_error if the file can't
// be opened and std::invalid_argument if it isn't a valid request.
std::vector<Waypoint> readRequestFile(const std::filesystem::path& path);

nlohmann::json toJson(const Waypoint& p); // [lat, lon]

// {"success": true, "visiting_order", "route_coords", "total_distance",
//  "road_segments", "segment_sources"}
nlohmann::json planToJson(const RoutePlan& plan);

// Response for rejected input: the message plus a trivial plan over the
// first waypoint (if any).
nlohmann::json invalidInputJson(const std::string& message, const std::vector<Waypoint>& points);

// {"error": message, "success": false}
nlohmann::json errorJson(const std::string& message);
