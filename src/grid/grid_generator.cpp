#include "grid_generator.h"
#include "../errors.hpp"
#include <cmath>

namespace Bewley {

AssetGrid GridGenerator::generate(const std::string& kind, double min_val, double max_val, int size, double curvature) {
    if (!std::isfinite(min_val) || !std::isfinite(max_val)) {
        throw InvalidGridError("grid bounds must be finite");
    }
    if (max_val <= min_val) {
        throw InvalidGridError("max (" + std::to_string(max_val) + ") must exceed min (" + std::to_string(min_val) + ")");
    }
    if (size < 2) {
        throw InvalidGridError("Grid size must be at least 2");
    }

    std::vector<double> nodes;
    if (kind == "uniform") {
        nodes = uniform(min_val, max_val, size);
    } else if (kind == "log_spaced") {
        nodes = log_spaced(min_val, max_val, size);
    } else if (kind == "power") {
        if (!(curvature >= 1.0)) throw InvalidGridError("power grid curvature must be >= 1");
        nodes = power(min_val, max_val, size, curvature);
    } else {
        throw InvalidGridError("Unknown grid kind: " + kind);
    }

    for (int i = 1; i < size; ++i) {
        if (!(nodes[i] > nodes[i - 1])) {
            throw InvalidGridError("grid is not strictly increasing at node " + std::to_string(i));
        }
    }
    return AssetGrid(nodes);
}

std::vector<double> GridGenerator::uniform(double min_val, double max_val, int size) {
    std::vector<double> grid(size);
    double step = (max_val - min_val) / (size - 1);
    for (int i = 0; i < size; ++i) {
        grid[i] = min_val + i * step;
    }
    grid[size - 1] = max_val;
    return grid;
}

std::vector<double> GridGenerator::log_spaced(double min_val, double max_val, int size) {
    // x_i = exp(i * log(max - min + 1) / (N-1)) - 1 + min
    std::vector<double> grid(size);
    double top = std::log(max_val - min_val + 1.0);

    for (int i = 0; i < size; ++i) {
        double ratio = static_cast<double>(i) / (size - 1);
        grid[i] = std::exp(top * ratio) - 1.0 + min_val;
    }

    // Ensure bounds are exact
    grid[0] = min_val;
    grid[size - 1] = max_val;

    return grid;
}

std::vector<double> GridGenerator::power(double min_val, double max_val, int size, double curvature) {
    std::vector<double> grid(size);
    for (int i = 0; i < size; ++i) {
        double t = static_cast<double>(i) / (size - 1);
        grid[i] = min_val + (max_val - min_val) * std::pow(t, curvature);
    }
    grid[size - 1] = max_val;
    return grid;
}

} // namespace Bewley
