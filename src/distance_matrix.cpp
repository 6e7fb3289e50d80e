#include "distance_matrix.hpp"
#include "parallel.hpp"
#include "debug.hpp"

#include <cmath>
#include <utility>

DistanceMatrix buildDistanceMatrix(const std::vector<Waypoint>& points,
                                   const DistanceProvider& provider,
                                   size_t maxConcurrency) {
    size_t n = points.size();
    DistanceMatrix matrix(n, std::vector<double>(n, 0.0));

    std::vector<std::pair<size_t, size_t>> pairs;
    pairs.reserve(n > 0 ? n * (n - 1) / 2 : 0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            pairs.emplace_back(i, j);
        }
    }

    auto results = runBatched<DistanceResult>(pairs.size(), maxConcurrency, [&](size_t k) {
        return provider.distance(points[pairs[k].first], points[pairs[k].second]);
    });

    size_t fallbacks = 0;
    for (size_t k = 0; k < pairs.size(); ++k) {
        auto [i, j] = pairs[k];
        matrix[i][j] = results[k].km;
        matrix[j][i] = results[k].km;
        if (results[k].source == DistanceSource::Fallback) ++fallbacks;
    }

    if (fallbacks > 0 && provider.hasRoutingService()) {
        LOG("Planner", fallbacks << " of " << pairs.size() << " pair distances used the haversine fallback");
    }
    DBG("Distance matrix built for " << n << " waypoints (" << pairs.size() << " pairs)");
    return matrix;
}

bool isValidDistanceMatrix(const DistanceMatrix& matrix, double eps) {
    size_t n = matrix.size();
    for (const auto& row : matrix) {
        if (row.size() != n) return false;
    }
    for (size_t i = 0; i < n; ++i) {
        if (std::abs(matrix[i][i]) > eps) return false;
        for (size_t j = 0; j < n; ++j) {
            if (matrix[i][j] < 0.0) return false;
            if (std::abs(matrix[i][j] - matrix[j][i]) > eps) return false;
        }
    }
    return true;
}
