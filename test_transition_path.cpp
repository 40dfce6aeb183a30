#include <iostream>
#include <vector>
#include <cassert>
#include <cmath>
#include "src/bewley/engine.h"
#include "src/errors.hpp"

using namespace Bewley;

static BewleyParams small_economy() {
    BewleyParams p;
    p.market = "huggett";
    p.scalars["beta"] = 0.95;
    p.scalars["gamma"] = 2.0;
    p.scalars["n_z"] = 2;
    p.scalars["rho"] = 0.9;
    p.scalars["sigma"] = 0.2;
    p.scalars["a_min"] = -2.0;
    p.scalars["a_max"] = 10.0;
    p.scalars["n_a"] = 49;
    p.scalars["r_low"] = -0.3;
    return p;
}

int main() {
    std::cout << "Testing transition path..." << std::endl;

    // 1. Limit path
    std::vector<double> phi = TransitionSolver::limit_path(-2.0, -1.0, 5, 2);
    assert(phi.size() == 5);
    assert(std::abs(phi[0] + 1.5) < 1e-15);
    for(int t=1; t<5; ++t) assert(phi[t] == -1.0);

    // 2. Steady-state facade
    BewleyParams p = small_economy();
    RecordingProgressSink sink;
    BewleyEngine engine(p, &sink);
    SteadyStateResult ss = engine.solve_steady_state();
    assert(ss.min_choice == 0);
    assert(sink.count(Stage::Income) == 1);
    assert(sink.count(Stage::Market) > 0);
    const DistributionStats& st = ss.stats;
    assert(std::abs(st.mean_assets - ss.equilibrium.demand) < 1e-10);
    assert(st.gini >= 0.0 && st.gini <= 1.0);
    assert(st.top10_share >= 0.1 - 1e-12 && st.top10_share <= 1.0);
    assert(st.share_at_limit >= 0.0 && st.constrained_share <= 1.0 + 1e-12);
    assert(st.aggregate_consumption > 0.0);

    bool thrown = false;
    try { engine.solve_steady_state(11.0); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);
    thrown = false;
    try { engine.solve_transition(); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    // 3. Tighter limit on the same grid
    SteadyStateResult tight = engine.solve_steady_state(-1.0);
    assert(tight.min_choice == engine.grid().index_at_or_above(-1.0));
    for(int pol : tight.equilibrium.household.policy) assert(pol >= tight.min_choice);

    // 4. Unanticipated tightening from -2 to -1 over 3 periods
    int T = 30;
    p.scalars["T"] = T;
    p.scalars["limit_initial"] = -2.0;
    p.scalars["limit_terminal"] = -1.0;
    p.scalars["adjust_periods"] = 3;
    // A 0.25 grid step puts the reachable excess demand floor near 0.02
    p.scalars["tol_path"] = 0.05;
    p.scalars["max_iter_path"] = 30;
    RecordingProgressSink path_sink;
    BewleyEngine shock(p, &path_sink);
    TransitionRun run = shock.solve_transition();
    const TransitionResult& path = run.path;
    std::cout << "Path status " << to_string(path.report.status) << " after " << path.report.iterations
              << " iters, max |ED| " << path.report.residual << std::endl;
    std::cout << "r_initial=" << run.initial.equilibrium.r << " r_terminal=" << run.terminal.equilibrium.r << std::endl;

    assert(path.periods == T);
    assert((int)path.r.size() == T && (int)path.excess.size() == T && (int)path.limits.size() == T);
    assert(path.limits[T - 1] == -1.0);
    assert(path.report.iterations >= 2 && path.report.iterations <= 30);
    assert(path.report.converged());
    assert(path.report.residual < 0.05);
    for(int t=0; t<T-1; ++t) assert(std::abs(path.excess[t]) <= path.report.residual);

    // The last rate is the terminal one; the gap left there is small once the path clears
    assert(path.r[T - 1] == run.terminal.equilibrium.r);
    assert(path.terminal_gap == path.excess[T - 1]);
    assert(std::abs(path.terminal_gap) < 0.1);
    double r_max = 1.0 / 0.95 - 1.0;
    for(double r : path.r) assert(r >= -0.3 && r <= r_max + 1e-12);

    // Forced deleveraging at the start pulls the rate below its terminal value
    assert(path.r[0] < run.terminal.equilibrium.r);
    assert(path_sink.count(Stage::Transition) == path.report.iterations + 1);

    // A tighter limit lowers the equilibrium rate
    assert(run.terminal.equilibrium.r <= run.initial.equilibrium.r + 1e-3);

    // Constraint respected at every date, mass conserved along the path
    const AssetGrid& grid = shock.grid();
    assert((int)path.policy.size() == T);
    assert((int)path.distribution.size() == T + 1);
    for(int t=0; t<T; ++t) {
        int k = grid.index_at_or_above(path.limits[t]);
        for(int pol : path.policy[t]) assert(pol >= k);
        assert(std::abs(path.excess[t] - (path.assets[t] - path.supply[t])) < 1e-12);
        assert(path.w[t] == 1.0);
    }
    for(const auto& D : path.distribution) {
        double s = 0.0;
        for(double d : D) s += d;
        assert(std::abs(s - 1.0) < 1e-9);
    }
    // Nobody below the terminal limit once it binds
    const Vector& D_end = path.distribution.back();
    int k_end = grid.index_at_or_above(-1.0);
    for(int j=0; j<shock.income().n_z; ++j)
        for(int i=0; i<k_end; ++i)
            assert(D_end[j * grid.size + i] == 0.0);

    std::cout << "SUCCESS: transition path verified." << std::endl;
    return 0;
}
