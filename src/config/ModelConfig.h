#ifndef BEWLEY_MODEL_CONFIG_H
#define BEWLEY_MODEL_CONFIG_H

#include <memory>
#include <string>
#include "../Params.hpp"
#include "../AssetGrid.hpp"
#include "../Progress.hpp"
#include "../blocks/MarketBlocks.hpp"

namespace Bewley {

enum class MarketKind { Huggett, Aiyagari };

struct HouseholdConfig {
    double beta = 0.993362;  // discount factor
    double gamma = 3.0;      // CRRA risk aversion
};

struct IncomeConfig {
    int n_z = 3;
    double rho = 0.95;
    double sigma = 0.12247448713915890; // sqrt(0.015)
    double mu = 0.0;
    double width = 0.0;                 // <= 0: Floden base sigma
};

struct GridConfig {
    std::string kind = "uniform";
    double a_min = -3.0;     // borrowing limit
    double a_max = 24.0;
    int n_a = 50;
    double curvature = 2.0;  // "power" grids only
};

struct MarketConfig {
    MarketKind kind = MarketKind::Huggett;
    double bond_supply = 0.0;
    double alpha = 0.36;
    double delta = 0.08;
    double tfp = 1.0;
    double r_low = -1.0;
    double r_high = 0.0;     // filled with 1/beta - 1 when not given
};

struct SolverConfig {
    double tol_v = 1e-6;
    int max_iter_v = 10000;
    double tol_d = 1e-10;
    int max_iter_d = 100000;
    double tol_r = 1e-4;
    int max_iter_r = 60;
    double tol_bracket = 1e-10;
    bool warm_start = true;
    bool strict_inner = false;
    int log_every = 0;       // inner progress cadence, 0 = summaries only
};

struct TransitionConfig {
    int periods = 0;             // 0 disables the transition path
    double limit_initial = -3.0; // borrowing limit before the change
    double limit_terminal = -3.0;
    int adjust_periods = 1;      // periods over which the limit moves linearly
    double tol = 1e-2;           // max_t |ED_t| along the path
    int max_iter = 30;           // Gauss-Seidel sweeps
    int max_bisect = 40;         // rate bisections per period and sweep
};

/**
 * Immutable, validated model configuration.
 *
 * Built once from BewleyParams and passed by const reference into every
 * component. Construction is the only place ranges are checked.
 */
struct ModelConfig {
    HouseholdConfig household;
    IncomeConfig income;
    GridConfig grid;
    MarketConfig market;
    SolverConfig solver;
    TransitionConfig transition;

    // Throws ConfigurationError on any out-of-range value.
    static ModelConfig from_params(const BewleyParams& params);

    // Re-check an assembled config (from_params calls this).
    void validate() const;

    std::unique_ptr<MarketRule> make_market_rule() const;
    AssetGrid make_grid() const;
    IncomeProcess make_income(ProgressSink& sink) const;
};

} // namespace Bewley

#endif // BEWLEY_MODEL_CONFIG_H
