#ifndef BEWLEY_GRID_GENERATOR_H
#define BEWLEY_GRID_GENERATOR_H

#include <string>
#include <vector>
#include "../AssetGrid.hpp"

namespace Bewley {

class GridGenerator {
public:
    // kind: "uniform", "log_spaced" or "power" (curvature >= 1 used by "power" only).
    // Throws InvalidGridError on max <= min, size < 2 or an unknown kind.
    static AssetGrid generate(const std::string& kind, double min_val, double max_val, int size, double curvature = 2.0);

private:
    static std::vector<double> uniform(double min_val, double max_val, int size);
    static std::vector<double> log_spaced(double min_val, double max_val, int size);
    static std::vector<double> power(double min_val, double max_val, int size, double curvature);
};

} // namespace Bewley

#endif // BEWLEY_GRID_GENERATOR_H
