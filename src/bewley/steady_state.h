#pragma once
#include <vector>
#include "types.h"
#include "../InequalityAnalyzer.hpp"
#include "../solver/EquilibriumSolver.hpp"

namespace Bewley {

struct SteadyStateResult {
    double borrowing_limit = 0.0;
    int min_choice = 0;            // grid index of the borrowing limit
    int n_a = 0;
    int n_z = 0;
    std::vector<double> asset_grid;
    std::vector<double> income_levels;
    EquilibriumResult equilibrium;
    DistributionStats stats;
};

}
