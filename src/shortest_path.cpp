#include "shortest_path.hpp"
#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

ShortestPath dijkstra(const WeightedGraph& graph, size_t start, size_t end) {
    size_t n = graph.vertexCount();
    if (start >= n || end >= n) {
        throw std::out_of_range("Shortest path " + std::to_string(start) + " -> " + std::to_string(end)
                                + " outside graph of " + std::to_string(n) + " vertices");
    }

    const double INF = std::numeric_limits<double>::infinity();
    const size_t NONE = static_cast<size_t>(-1);
    std::vector<double> dist(n, INF);
    std::vector<size_t> previous(n, NONE);
    std::vector<bool> visited(n, false);
    dist[start] = 0.0;

    while (true) {
        // Find unvisited vertex with minimum distance
        size_t u = NONE;
        double minDist = INF;
        for (size_t i = 0; i < n; ++i) {
            if (!visited[i] && dist[i] < minDist) {
                minDist = dist[i];
                u = i;
            }
        }

        if (u == NONE || u == end) break;
        visited[u] = true;

        for (const auto& [v, w] : graph.neighbors(u)) {
            if (visited[v]) continue;
            double alt = dist[u] + w;
            if (alt < dist[v]) {
                dist[v] = alt;
                previous[v] = u;
            }
        }
    }

    ShortestPath result{{}, dist[end]};
    if (dist[end] == INF) return result;

    // Walk predecessors back from the target
    for (size_t v = end; v != NONE; v = previous[v]) {
        result.path.push_back(v);
    }
    std::reverse(result.path.begin(), result.path.end());
    return result;
}

double accumulatePathCost(const WeightedGraph& graph, const VisitingOrder& order) {
    double total = 0.0;
    for (size_t i = 0; i + 1 < order.size(); ++i) {
        auto sp = dijkstra(graph, order[i], order[i + 1]);
        DBG("Hop " << order[i] << " -> " << order[i + 1] << ": " << sp.distance << " km");
        total += sp.distance;
    }
    return roundToCents(total);
}

double roundToCents(double km) {
    return std::round(km * 100.0) / 100.0;
}
