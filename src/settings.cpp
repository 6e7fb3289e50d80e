#include "settings.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

// Reads one value for `key`, or throws std::invalid_argument
template<typename T>
T readOrThrow(std::istream& in, const std::string& key) {
    T value;
    in >> value;
    if (!in) {
        throw std::invalid_argument("Could not read a value for setting \"" + key + "\"");
    }
    return value;
}

Settings parseSettings(std::istream& in) {
    Settings s;
    std::string key;
    while (in >> key) {
        if (key == "inputDir") {
            s.inputDir = readOrThrow<std::string>(in, key);
        } else if (key == "outputDir") {
            s.outputDir = readOrThrow<std::string>(in, key);
        } else if (key == "file") {
            s.filesToRead.push_back(readOrThrow<std::string>(in, key));
        } else if (key == "logFile") {
            s.logFile = readOrThrow<std::string>(in, key);
        } else if (key == "osrmUrl") {
            s.routing.baseUrl = readOrThrow<std::string>(in, key);
        } else if (key == "osrmProfile") {
            s.routing.profile = readOrThrow<std::string>(in, key);
        } else if (key == "timeoutSeconds") {
            s.routing.timeoutSeconds = readOrThrow<double>(in, key);
            if (!(s.routing.timeoutSeconds >= 0.001)) {
                throw std::invalid_argument("timeoutSeconds must be at least 0.001");
            }
        } else if (key == "useRoutingService") {
            s.useRoutingService = readOrThrow<int>(in, key) != 0;
        } else if (key == "maxConcurrentRequests") {
            int n = readOrThrow<int>(in, key);
            if (n < 1) throw std::invalid_argument("maxConcurrentRequests must be at least 1");
            s.maxConcurrentRequests = static_cast<size_t>(n);
        } else {
            // Unknown key, skip its value
            std::string ignored;
            in >> ignored;
        }
    }

    // Drop a trailing slash so URLs don't end up with "//route"
    while (!s.routing.baseUrl.empty() && s.routing.baseUrl.back() == '/') {
        s.routing.baseUrl.pop_back();
    }
    return s;
}

Settings loadSettings(const std::string& settingsFile) {
    std::ifstream in(settingsFile);
    if (!in) {
        std::cerr << "No settings file found. Using defaults." << std::endl;
        return Settings{};
    }
    return parseSettings(in);
}
