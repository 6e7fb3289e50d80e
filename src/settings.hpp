#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "osrm_client.hpp"

// Driver settings
struct Settings {
    std::filesystem::path inputDir = "./data/requests";
    std::filesystem::path outputDir = "./data/plans";
    std::vector<std::string> filesToRead; // empty = process all
    std::optional<std::filesystem::path> logFile; // optional log file
    RoutingConfig routing;
    bool useRoutingService = true; // false = haversine / straight line only
    size_t maxConcurrentRequests = 8;
};

// Whitespace separated "key value" pairs; unknown keys are skipped.
// Throws std::invalid_argument if a value can't be read.
Settings parseSettings(std::istream& in);

// Reads a settings file, or returns the defaults if it doesn't exist.
Settings loadSettings(const std::string& settingsFile);
