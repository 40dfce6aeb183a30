#ifndef BEWLEY_TRANSITION_PATH_H
#define BEWLEY_TRANSITION_PATH_H

#include <vector>
#include "EquilibriumSolver.hpp"

namespace Bewley {

struct TransitionOptions {
    double tol = 1e-2;          // max_t |ED_t| to accept, over the free periods
    int max_iter = 30;          // Gauss-Seidel sweeps
    int max_bisect = 40;        // rate bisections per period and sweep
    double tol_bracket = 1e-9;  // stop bisecting once the rate bracket is this narrow
    double r_min = -1.0;        // search range for the rate path
    double r_max = 1.0;
    bool keep_paths = true;     // store policy and distribution for every t
};

struct TransitionResult {
    int periods = 0;
    std::vector<double> limits;   // borrowing limit on a' chosen at t
    std::vector<double> r;        // return on assets carried from t to t+1
    std::vector<double> w;        // wage paid at t
    std::vector<double> assets;   // sum D_t * a', i.e. sum D_{t+1} * a
    std::vector<double> supply;
    std::vector<double> excess;
    double terminal_gap = 0.0;    // ED at T-1, where the rate is pinned to the terminal one
    std::vector<std::vector<int>> policy;  // per t, when keep_paths
    std::vector<Vector> distribution;      // D_0 .. D_T, when keep_paths
    ConvergenceReport report;
};

/**
 * Perfect-foresight transition between two stationary equilibria after an
 * unanticipated change of the borrowing limit at t = 0.
 *
 * Timing: households enter t with assets a, earn (1 + r_{t-1}) a + w(r_{t-1}) y and
 * choose a' >= limit_t. The stock entering t = 0 earns the initial stationary rate.
 * V_T is the terminal stationary value, D_0 the initial stationary distribution.
 * Market clearing at t: sum D_t a' = supply(r_t).
 *
 * V_T already prices period T at the terminal rate, so r_{T-1} is pinned there and
 * r_0 .. r_{T-2} are solved for. Each sweep walks forward in time and bisects r_t on
 * [r_min, r_max] until period t clears, holding the other rates fixed; a trial r_t is
 * priced by re-solving V_{t+1} and the backward steps t .. 0, then pushing D forward.
 */
class TransitionSolver {
    const AssetGrid& grid;
    const IncomeProcess& income;
    const MarketRule& market;
    HouseholdSolver household;

public:
    TransitionSolver(const AssetGrid& g, const IncomeProcess& inc, const MarketRule& m,
                     double beta, double gamma);

    // Limit path moving linearly from `initial` to `terminal` over adjust_periods periods
    static std::vector<double> limit_path(double initial, double terminal, int periods, int adjust_periods);

    TransitionResult solve(const EquilibriumResult& initial,
                           const EquilibriumResult& terminal,
                           const std::vector<double>& limits,
                           const TransitionOptions& opts,
                           ProgressSink& sink = null_sink()) const;

private:
    struct PathContext {
        const EquilibriumResult& initial;
        const EquilibriumResult& terminal;
        const std::vector<int>& min_choice;
    };

    Prices period_prices(double r_initial, const std::vector<double>& r_path, int t) const;

    // Backward induction given the rate path; fills values V_0 .. V_T and policy[t]
    void backward(const PathContext& ctx, const std::vector<double>& r_path,
                  std::vector<Vector>& values, std::vector<std::vector<int>>& policy) const;

    // Forward pass from D_0; fills the aggregate paths of `res` and returns max |ED_t| over t < T-1
    double forward(const PathContext& ctx, const std::vector<std::vector<int>>& policy,
                   TransitionResult& res, std::vector<Vector>& dists) const;

    // ED_t when r_t is replaced by x; `values` must come from a backward pass on r_path
    double period_excess(const PathContext& ctx, const std::vector<double>& r_path,
                         const std::vector<Vector>& values, int t, double x) const;

    // One forward Gauss-Seidel sweep over t = 0 .. T-2; returns the number of rates moved
    int sweep(const PathContext& ctx, std::vector<double>& r_path, const TransitionOptions& opts) const;
};

} // namespace Bewley

#endif // BEWLEY_TRANSITION_PATH_H
