#include "transition_path.h"
#include "../aggregator/distribution.h"
#include "../errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <stdexcept>
#include <utility>

namespace Bewley {

TransitionSolver::TransitionSolver(const AssetGrid& g, const IncomeProcess& inc, const MarketRule& m,
                                   double beta, double gamma)
    : grid(g), income(inc), market(m), household(g, inc, beta, gamma) {}

std::vector<double> TransitionSolver::limit_path(double initial, double terminal, int periods, int adjust_periods) {
    if (periods < 1) throw ConfigurationError("transition needs at least one period");
    if (adjust_periods < 1) throw ConfigurationError("adjust_periods must be >= 1");

    std::vector<double> phi(periods);
    for (int t = 0; t < periods; ++t) {
        if (t < adjust_periods) {
            double s = static_cast<double>(t + 1) / adjust_periods;
            phi[t] = initial + (terminal - initial) * s;
        } else {
            phi[t] = terminal;
        }
    }
    return phi;
}

Prices TransitionSolver::period_prices(double r_initial, const std::vector<double>& r_path, int t) const {
    // Assets entering t earn the rate set at t-1; the initial stock earns the old stationary rate
    return market.prices(t == 0 ? r_initial : r_path[t - 1]);
}

void TransitionSolver::backward(const PathContext& ctx, const std::vector<double>& r_path,
                                std::vector<Vector>& values, std::vector<std::vector<int>>& policy) const {
    int T = static_cast<int>(r_path.size());
    values.assign(T + 1, Vector());
    policy.assign(T, std::vector<int>());

    values[T] = ctx.terminal.household.value;
    for (int t = T - 1; t >= 0; --t) {
        household.bellman_step(period_prices(ctx.initial.r, r_path, t), values[t + 1], ctx.min_choice[t],
                               values[t], policy[t]);
    }
}

double TransitionSolver::forward(const PathContext& ctx, const std::vector<std::vector<int>>& policy,
                                 TransitionResult& res, std::vector<Vector>& dists) const {
    int T = static_cast<int>(policy.size());
    dists.assign(1, ctx.initial.distribution.D);
    res.assets.assign(T, 0.0);
    res.supply.assign(T, 0.0);
    res.excess.assign(T, 0.0);
    res.w.assign(T, 0.0);

    double max_ed = 0.0;
    for (int t = 0; t < T; ++t) {
        Vector D_next = DistributionAggregator::forward_step(dists.back(), policy[t], income, grid.size);
        DistributionAggregator::check_mass(D_next, "transition period " + std::to_string(t));

        res.w[t] = period_prices(ctx.initial.r, res.r, t).w;
        res.assets[t] = DistributionAggregator::aggregate_assets(D_next, grid, income.n_z);
        res.supply[t] = market.asset_supply(res.r[t]);
        res.excess[t] = res.assets[t] - res.supply[t];
        if (t < T - 1) max_ed = std::max(max_ed, std::abs(res.excess[t]));
        dists.push_back(std::move(D_next));
    }
    res.terminal_gap = res.excess[T - 1];
    return max_ed;
}

double TransitionSolver::period_excess(const PathContext& ctx, const std::vector<double>& r_path,
                                       const std::vector<Vector>& values, int t, double x) const {
    // Period t+1 earns the trial rate; V_{t+2} onward does not depend on it
    Vector V_next, V_t;
    std::vector<int> scratch;
    household.bellman_step(market.prices(x), values[t + 2], ctx.min_choice[t + 1], V_next, scratch);

    std::vector<std::vector<int>> policy(t + 1);
    for (int s = t; s >= 0; --s) {
        household.bellman_step(period_prices(ctx.initial.r, r_path, s), V_next, ctx.min_choice[s], V_t, policy[s]);
        V_next.swap(V_t);
    }

    Vector D = ctx.initial.distribution.D;
    for (int s = 0; s <= t; ++s) {
        D = DistributionAggregator::forward_step(D, policy[s], income, grid.size);
    }
    return DistributionAggregator::aggregate_assets(D, grid, income.n_z) - market.asset_supply(x);
}

int TransitionSolver::sweep(const PathContext& ctx, std::vector<double>& r_path, const TransitionOptions& opts) const {
    int T = static_cast<int>(r_path.size());
    std::vector<Vector> values;
    std::vector<std::vector<int>> policy;
    backward(ctx, r_path, values, policy);

    // Each period is cleared well inside the path tolerance
    const double target = 0.1 * opts.tol;
    int moved = 0;
    for (int t = 0; t + 1 < T; ++t) {
        double f = period_excess(ctx, r_path, values, t, r_path[t]);
        if (std::abs(f) < target) continue;

        double best_r = r_path[t];
        double best_f = std::abs(f);
        double lo = opts.r_min, hi = opts.r_max;
        if (period_excess(ctx, r_path, values, t, lo) > 0.0) {
            best_r = lo;
        } else if (period_excess(ctx, r_path, values, t, hi) < 0.0) {
            best_r = hi;
        } else {
            for (int k = 0; k < opts.max_bisect && hi - lo > opts.tol_bracket; ++k) {
                double mid = 0.5 * (lo + hi);
                double fm = period_excess(ctx, r_path, values, t, mid);
                if (std::abs(fm) < best_f) {
                    best_f = std::abs(fm);
                    best_r = mid;
                }
                if (best_f < target) break;
                if (fm > 0.0) hi = mid;
                else lo = mid;
            }
        }

        if (best_r != r_path[t]) {
            r_path[t] = best_r;
            ++moved;
        }
    }
    return moved;
}

TransitionResult TransitionSolver::solve(const EquilibriumResult& initial,
                                         const EquilibriumResult& terminal,
                                         const std::vector<double>& limits,
                                         const TransitionOptions& opts,
                                         ProgressSink& sink) const {
    int T = static_cast<int>(limits.size());
    int size = grid.size * income.n_z;
    if (T < 1) throw ConfigurationError("limit path is empty");
    if ((int)initial.distribution.D.size() != size || (int)terminal.household.value.size() != size) {
        throw std::invalid_argument("stationary equilibria do not match the transition state space");
    }
    if (!(opts.r_min < opts.r_max)) throw ConfigurationError("rate search range must satisfy r_min < r_max");
    if (!(opts.tol > 0.0)) throw ConfigurationError("path tolerance must be positive");
    if (opts.max_iter < 1 || opts.max_bisect < 1) throw ConfigurationError("iteration limits must be >= 1");

    // 1. Constraint index per period
    std::vector<int> min_choice(T);
    for (int t = 0; t < T; ++t) {
        int k = grid.index_at_or_above(limits[t]);
        if (k >= grid.size) throw ConfigurationError("borrowing limit above the asset grid at t=" + std::to_string(t));
        min_choice[t] = k;
    }
    PathContext ctx{initial, terminal, min_choice};

    // 2. Initial guess: linear from the initial to the terminal rate, which r_{T-1} keeps
    TransitionResult res;
    res.periods = T;
    res.limits = limits;
    res.r.resize(T);
    for (int t = 0; t < T; ++t) {
        double s = (T > 1) ? static_cast<double>(t) / (T - 1) : 1.0;
        res.r[t] = initial.r + (terminal.r - initial.r) * s;
    }
    res.r[T - 1] = terminal.r;

    std::vector<Vector> values;
    std::vector<std::vector<int>> policy;
    std::vector<Vector> dists;
    std::vector<double> best_r;
    double best_ed = std::numeric_limits<double>::infinity();
    double max_ed = 0.0;
    int iter = 0;
    ConvergenceStatus status = ConvergenceStatus::MaxIterations;

    while (true) {
        ++iter;

        // 3. Evaluate the current path
        backward(ctx, res.r, values, policy);
        max_ed = forward(ctx, policy, res, dists);
        sink.on_progress({Stage::Transition, iter, max_ed, res.r.front(), ""});

        if (max_ed < best_ed) {
            best_ed = max_ed;
            best_r = res.r;
        }
        if (max_ed < opts.tol) {
            status = ConvergenceStatus::Converged;
            break;
        }
        if (iter == opts.max_iter) break;

        // 4. Gauss-Seidel sweep; no rate moving means every period sits at its best bracket point
        if (sweep(ctx, res.r, opts) == 0) {
            status = ConvergenceStatus::BracketExhausted;
            break;
        }
    }

    // 5. Sweeps are not monotone; hand back the best path seen
    if (status != ConvergenceStatus::Converged && best_ed < max_ed) {
        res.r = best_r;
        backward(ctx, res.r, values, policy);
        max_ed = forward(ctx, policy, res, dists);
    }

    res.report.iterations = iter;
    res.report.residual = max_ed;
    res.report.status = status;
    if (opts.keep_paths) {
        res.policy = std::move(policy);
        res.distribution = std::move(dists);
    }

    sink.on_progress({Stage::Transition, iter, max_ed, res.r.front(),
                      std::string("finished: ") + to_string(res.report.status)});
    return res;
}

} // namespace Bewley
