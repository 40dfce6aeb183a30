#pragma once
#include <map>
#include <string>
#include <vector>

// Discretized income chain
struct IncomeProcess {
    int n_z = 0;
    std::vector<double> z_grid;     // income levels, stationary mean 1
    std::vector<double> log_nodes;  // quadrature nodes of log income
    std::vector<double> Pi_flat;    // Flattened transition matrix (row-major)
    std::vector<double> stationary; // invariant distribution of Pi

    // Helper to get Pi(i, j)
    double prob(int i, int j) const {
        return Pi_flat[i * n_z + j];
    }

    double mean_income() const {
        double m = 0.0;
        for(int j=0; j<n_z; ++j) m += stationary[j] * z_grid[j];
        return m;
    }
};

// Named scalar parameters as supplied by the caller (JSON file, Python dict).
// Validated into Bewley::ModelConfig before use.
struct BewleyParams {
    std::map<std::string, double> scalars;
    std::string market = "huggett";      // "huggett" | "aiyagari"
    std::string grid_kind = "uniform";   // "uniform" | "log_spaced" | "power"

    double get(const std::string& key, double default_val) const {
        auto it = scalars.find(key);
        if (it != scalars.end()) return it->second;
        return default_val;
    }

    bool has(const std::string& key) const {
        return scalars.count(key) > 0;
    }
};
