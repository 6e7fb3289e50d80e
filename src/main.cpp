#include "route_planner.hpp"
#include "osrm_client.hpp"
#include "plan_io.hpp"
#include "settings.hpp"

#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    // Load settings
    Settings settings;
    try {
        settings = loadSettings(argc > 1 ? argv[1] : "settings.txt");
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid settings: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Settings:\n";
    std::cout << "  Input directory: " << settings.inputDir << "\n";
    std::cout << "  Output directory: " << settings.outputDir << "\n";
    if (!settings.filesToRead.empty()) {
        std::cout << "  Files to read:\n";
        for (const auto& f : settings.filesToRead) {
            std::cout << "    " << f << "\n";
        }
    } else {
        std::cout << "  Processing all request files in input directory.\n";
    }
    std::cout << "  Log file: " << (settings.logFile ? settings.logFile->string() : "stdout") << "\n";
    if (settings.useRoutingService) {
        std::cout << "  Routing service: " << settings.routing.baseUrl << " (" << settings.routing.profile
                  << ", timeout " << settings.routing.timeoutSeconds << " s)\n";
    } else {
        std::cout << "  Routing service: disabled, using haversine distances\n";
    }
    std::cout << "  Max concurrent requests: " << settings.maxConcurrentRequests << "\n";

    // Set up logging
    std::ofstream logFile;
    std::ostream& logStream = [&]() -> std::ostream& {
        if (settings.logFile) {
            logFile.open(*settings.logFile); // overwrite mode
            if (logFile) {
                return logFile;
            } else {
                std::cerr << "Failed to open log file. Falling back to stdout.\n";
            }
        }
        return std::cout;
    }();

    namespace fs = std::filesystem;
    if (!fs::is_directory(settings.inputDir)) {
        std::cerr << "Input directory does not exist: " << settings.inputDir << "\n";
        return 1;
    }
    std::error_code ec;
    fs::create_directories(settings.outputDir, ec);
    if (ec) {
        std::cerr << "Cannot create output directory " << settings.outputDir << ": " << ec.message() << "\n";
        return 1;
    }
    logStream << "Input directory: " << settings.inputDir << "\n";
    logStream << "Output directory: " << settings.outputDir << "\n";

    std::shared_ptr<const RoutingService> service;
    if (settings.useRoutingService) {
        service = std::make_shared<OsrmRoutingService>(settings.routing);
    }
    const DistanceProvider provider(service);
    PlannerOptions options;
    options.maxConcurrentRequests = settings.maxConcurrentRequests;

    int failures = 0;

    // Iterate through all request files in the input directory
    for (const auto& entry : fs::directory_iterator(settings.inputDir)) {
        if (!settings.filesToRead.empty()) {
            if (std::find(settings.filesToRead.begin(),
                          settings.filesToRead.end(),
                          entry.path().filename().string()) == settings.filesToRead.end()) {
                continue;
            }
        }
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;

        const fs::path inputFile = entry.path();
        const fs::path outputFile = settings.outputDir / inputFile.filename();

        logStream << "Processing file: " << inputFile << "\n";

        auto startTime = std::chrono::high_resolution_clock::now();

        // Read, validate and plan. Invalid input gets the same answer the
        // web endpoint gave; anything else becomes a generic error response.
        nlohmann::json response;
        std::vector<Waypoint> points;
        double dist = 0.0;
        try {
            points = readRequestFile(inputFile);
            validateWaypoints(points);
            RoutePlan plan = planRoute(points, provider, options);
            dist = plan.totalDistance;
            response = planToJson(plan);
        } catch (const std::invalid_argument& e) {
            logStream << "Rejected request " << inputFile << ": " << e.what() << "\n";
            response = invalidInputJson(e.what(), points);
            ++failures;
        } catch (const std::exception& e) {
            logStream << "Failed to plan route for file: " << inputFile << ": " << e.what() << "\n";
            response = errorJson(e.what());
            ++failures;
        }

        // Write the response next to the other plans
        std::ofstream outFile(outputFile);
        if (!outFile) {
            logStream << "Failed to open output file: " << outputFile << "\n";
            ++failures;
            continue;
        }
        outFile << response.dump(2) << "\n";
        outFile.close();

        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();

        logStream << "Finished processing file: " << inputFile
                  << " in " << duration << " ms, " << points.size() << " waypoints, distance="
                  << dist << " km\n";
    }

    return failures == 0 ? 0 : 2;
}
