#pragma once
#include <algorithm>
#include <stdexcept>
#include <vector>
#include "AssetGrid.hpp"
#include "bewley/types.h"

namespace Bewley {

struct DistributionStats {
    double mean_assets = 0.0;
    double aggregate_consumption = 0.0;
    double share_at_limit = 0.0;     // mass sitting on the lowest admissible node
    double constrained_share = 0.0;  // mass whose choice is the lowest admissible node
    double gini = 0.0;               // wealth measured relative to the grid floor
    double top10_share = 0.0;
    std::vector<double> marginal;    // mass per asset node
};

class InequalityAnalyzer {
    const AssetGrid& grid;
    int n_z;

public:
    InequalityAnalyzer(const AssetGrid& g, int nz) : grid(g), n_z(nz) {}

    std::vector<double> marginal(const Vector& D) const {
        int na = grid.size;
        if ((int)D.size() != na * n_z) throw std::invalid_argument("distribution size mismatch");
        std::vector<double> m(na, 0.0);
        for(int j=0; j<n_z; ++j)
            for(int i=0; i<na; ++i)
                m[i] += D[j*na + i];
        return m;
    }

    DistributionStats compute(const Vector& D, const Vector& c_pol,
                              const std::vector<int>& policy, int min_choice = 0) const {
        int na = grid.size;
        if (c_pol.size() != D.size() || policy.size() != D.size()) {
            throw std::invalid_argument("policy size mismatch");
        }
        if (min_choice < 0 || min_choice >= na) throw std::invalid_argument("min_choice out of range");

        DistributionStats s;
        s.marginal = marginal(D);

        for(int i=0; i<na; ++i) s.mean_assets += s.marginal[i] * grid.nodes[i];
        s.share_at_limit = s.marginal[min_choice];

        for(size_t k=0; k<D.size(); ++k) {
            s.aggregate_consumption += D[k] * c_pol[k];
            if (policy[k] == min_choice) s.constrained_share += D[k];
        }

        // Lorenz curve over nodes (already sorted by wealth)
        // Gini = 1 - 2 * area under the Lorenz curve
        double total_mass = 0.0;
        double total_wealth = 0.0;
        for(int i=0; i<na; ++i) {
            total_mass += s.marginal[i];
            total_wealth += s.marginal[i] * (grid.nodes[i] - grid.min());
        }
        if (total_wealth <= 0.0 || total_mass <= 0.0) return s;

        double cum_wealth = 0.0;
        double lorenz_area = 0.0;
        for(int i=0; i<na; ++i) {
            double mass = s.marginal[i] / total_mass;
            double prev = cum_wealth;
            cum_wealth += s.marginal[i] * (grid.nodes[i] - grid.min()) / total_wealth;
            lorenz_area += 0.5 * (prev + cum_wealth) * mass;
        }
        s.gini = 1.0 - 2.0 * lorenz_area;

        // Top 10%: walk down from the richest node, splitting the node at the cutoff
        double remaining = 0.10 * total_mass;
        double top_wealth = 0.0;
        for(int i=na-1; i>=0 && remaining > 0.0; --i) {
            double take = std::min(remaining, s.marginal[i]);
            top_wealth += take * (grid.nodes[i] - grid.min());
            remaining -= take;
        }
        s.top10_share = top_wealth / total_wealth;
        return s;
    }
};

} // namespace Bewley
