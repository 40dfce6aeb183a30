#include "engine.h"
#include "../errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace Bewley {

BewleyEngine::BewleyEngine(const ModelConfig& config, ProgressSink* sink)
    : config_((config.validate(), config)),
      sink_(sink != nullptr ? sink : &quiet_),
      income_(config.make_income(*sink_)),
      grid_(config.make_grid()),
      market_(config.make_market_rule()) {
}

BewleyEngine::BewleyEngine(const BewleyParams& params, ProgressSink* sink)
    : BewleyEngine(ModelConfig::from_params(params), sink) {}

EquilibriumOptions BewleyEngine::equilibrium_options(int min_choice) const {
    const auto& s = config_.solver;
    EquilibriumOptions opts;
    opts.r_low = config_.market.r_low;
    opts.r_high = config_.market.r_high;
    opts.tol_r = s.tol_r;
    opts.max_iter = s.max_iter_r;
    opts.tol_bracket = s.tol_bracket;
    opts.warm_start = s.warm_start;
    opts.strict_inner = s.strict_inner;
    opts.min_choice = min_choice;
    opts.vfi.tol = s.tol_v;
    opts.vfi.max_iter = s.max_iter_v;
    opts.vfi.log_every = s.log_every;
    opts.dist.tol = s.tol_d;
    opts.dist.max_iter = s.max_iter_d;
    opts.dist.log_every = s.log_every;
    return opts;
}

SteadyStateResult BewleyEngine::solve_steady_state() const {
    return solve_steady_state(grid_.min());
}

SteadyStateResult BewleyEngine::solve_steady_state(double borrowing_limit) const {
    int k = grid_.index_at_or_above(borrowing_limit);
    if (borrowing_limit < grid_.min() - 1e-10 || k >= grid_.size - 1) {
        throw ConfigurationError("borrowing limit " + std::to_string(borrowing_limit) +
                                 " must lie within the asset grid");
    }

    // 1. Solve for the equilibrium price
    EquilibriumSolver solver(grid_, income_, *market_, config_.household.beta, config_.household.gamma);
    SteadyStateResult res;
    res.borrowing_limit = borrowing_limit;
    res.min_choice = k;
    res.n_a = grid_.size;
    res.n_z = income_.n_z;
    res.asset_grid = grid_.nodes;
    res.income_levels = income_.z_grid;
    res.equilibrium = solver.solve(equilibrium_options(k), *sink_);

    // 2. Distribution statistics
    InequalityAnalyzer analyzer(grid_, income_.n_z);
    const auto& eq = res.equilibrium;
    res.stats = analyzer.compute(eq.distribution.D, eq.household.c_pol, eq.household.policy, k);
    return res;
}

TransitionRun BewleyEngine::solve_transition() const {
    const auto& tc = config_.transition;
    if (tc.periods < 2) {
        throw ConfigurationError("transition path requested but T < 2");
    }

    TransitionRun run;
    run.initial = solve_steady_state(tc.limit_initial);
    run.terminal = solve_steady_state(tc.limit_terminal);

    TransitionSolver solver(grid_, income_, *market_, config_.household.beta, config_.household.gamma);
    std::vector<double> limits = TransitionSolver::limit_path(tc.limit_initial, tc.limit_terminal,
                                                              tc.periods, tc.adjust_periods);

    TransitionOptions opts;
    opts.tol = tc.tol;
    opts.max_iter = tc.max_iter;
    opts.max_bisect = tc.max_bisect;
    // Search the stationary bracket, strictly above the market's lower bound
    opts.r_min = std::max(config_.market.r_low, market_->min_rate() + 1e-8);
    opts.r_max = config_.market.r_high;

    run.path = solver.solve(run.initial.equilibrium, run.terminal.equilibrium, limits, opts, *sink_);
    return run;
}

} // namespace Bewley
