#include "osrm_client.hpp"
#include "debug.hpp"

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <utility>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(data, size * nmemb);
    return size * nmemb;
}

// First route of a response with "code": "Ok", or nullptr
const json* firstRoute(const json& data) {
    if (!data.is_object() || data.value("code", std::string()) != "Ok") return nullptr;
    auto routes = data.find("routes");
    if (routes == data.end() || !routes->is_array() || routes->empty()) return nullptr;
    return &(*routes)[0];
}

} // namespace

std::string osrmRouteUrl(const RoutingConfig& config, const Waypoint& from, const Waypoint& to,
                         bool fullGeometry) {
    std::ostringstream url;
    url << std::setprecision(10);
    url << config.baseUrl << "/route/v1/" << config.profile << "/"
        << from.lon << "," << from.lat << ";" << to.lon << "," << to.lat;
    if (fullGeometry) {
        url << "?overview=full&geometries=geojson";
    } else {
        url << "?overview=false";
    }
    return url.str();
}

std::optional<double> parseOsrmDistance(const std::string& body) {
    try {
        json data = json::parse(body);
        const json* route = firstRoute(data);
        if (!route) return std::nullopt;
        auto distance = route->find("distance");
        if (distance == route->end() || !distance->is_number()) return std::nullopt;
        double meters = distance->get<double>();
        if (meters < 0.0) return std::nullopt;
        return meters / 1000.0;
    } catch (const json::exception& e) {
        DBG("OSRM distance payload rejected: " << e.what());
        return std::nullopt;
    }
}

std::optional<Polyline> parseOsrmGeometry(const std::string& body) {
    try {
        json data = json::parse(body);
        const json* route = firstRoute(data);
        if (!route) return std::nullopt;
        const json& coordinates = route->at("geometry").at("coordinates");
        if (!coordinates.is_array() || coordinates.empty()) return std::nullopt;

        Polyline path;
        path.reserve(coordinates.size());
        for (const auto& c : coordinates) {
            if (!c.is_array() || c.size() < 2) return std::nullopt;
            // GeoJSON order is [lon, lat]
            path.push_back({c[1].get<double>(), c[0].get<double>()});
        }
        return path;
    } catch (const json::exception& e) {
        DBG("OSRM geometry payload rejected: " << e.what());
        return std::nullopt;
    }
}

std::optional<HttpResponse> httpGet(const std::string& url, double timeoutSeconds) {
    static std::once_flag curlInit;
    static CURLcode initResult = CURLE_OK;
    std::call_once(curlInit, [] { initResult = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (initResult != CURLE_OK) {
        LOG("OSRM", "curl_global_init() failed: " << curl_easy_strerror(initResult));
        return std::nullopt;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG("OSRM", "Failed to initialize curl");
        return std::nullopt;
    }

    std::string responseData;
    // 0 means "no timeout" to curl
    long timeoutMs = std::max(1L, static_cast<long>(timeoutSeconds * 1000.0));

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseData);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // requests run on worker threads
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        LOG("OSRM", "Request failed: " << curl_easy_strerror(res) << " (" << url << ")");
        curl_easy_cleanup(curl);
        return std::nullopt;
    }

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_easy_cleanup(curl);

    return HttpResponse{httpCode, std::move(responseData)};
}

OsrmRoutingService::OsrmRoutingService(RoutingConfig config)
    : config_(std::move(config)) {}

std::optional<std::string> OsrmRoutingService::fetch(const std::string& url) const {
    auto response = httpGet(url, config_.timeoutSeconds);
    if (!response) return std::nullopt;
    if (response->status != 200) {
        LOG("OSRM", "HTTP error: " << response->status << " (" << url << ")");
        return std::nullopt;
    }
    return std::move(response->body);
}

std::optional<double> OsrmRoutingService::routeDistance(const Waypoint& from, const Waypoint& to) const {
    auto body = fetch(osrmRouteUrl(config_, from, to, false));
    if (!body) return std::nullopt;
    return parseOsrmDistance(*body);
}

std::optional<Polyline> OsrmRoutingService::routeGeometry(const Waypoint& from, const Waypoint& to) const {
    auto body = fetch(osrmRouteUrl(config_, from, to, true));
    if (!body) return std::nullopt;
    return parseOsrmGeometry(*body);
}
