#include <iostream>
#include <vector>
#include <cassert>
#include <cmath>
#include "src/solver/EquilibriumSolver.hpp"
#include "src/blocks/IncomeProcessFactory.hpp"
#include "src/grid/grid_generator.h"

using namespace Bewley;

static void check_bracket(const EquilibriumResult& res, double tol_r = 1e-4) {
    assert(res.r_low <= res.r + 1e-15 && res.r <= res.r_high + 1e-15);
    assert((int)res.r_path.size() == res.report.iterations);
    assert(res.r_path.size() == res.excess_path.size());
    assert(std::abs(res.excess - (res.demand - res.supply)) < 1e-12);
    assert(res.report.residual >= 0.0);
    assert(res.report.residual == std::abs(res.excess));
    if (res.report.converged()) assert(std::abs(res.excess) < tol_r);
}

int main() {
    std::cout << "Testing EquilibriumSolver (bisection)..." << std::endl;

    // 1. Small Huggett economy
    AssetGrid grid = GridGenerator::generate("uniform", -2.0, 15.0, 40);
    IncomeProcess income = IncomeProcessFactory::make_tauchen_hussey(2, 0.9, 0.2);
    double beta = 0.96, gamma = 2.0;

    EquilibriumOptions opts;
    opts.r_low = -0.2;
    opts.r_high = 0.04;

    // Supply equal to the demand at the first candidate: recovered exactly on iteration 1
    double r_star = 0.5 * (opts.r_low + opts.r_high);
    BondMarket zero_supply(0.0);
    EquilibriumSolver demand_solver(grid, income, zero_supply, beta, gamma);
    MarketEvaluation at_star = demand_solver.evaluate(r_star, opts);
    std::cout << "Demand at r=" << r_star << ": " << at_star.demand << std::endl;

    BondMarket target(at_star.demand);
    EquilibriumSolver solver(grid, income, target, beta, gamma);
    EquilibriumResult exact = solver.solve(opts);
    assert(exact.report.converged());
    assert(exact.report.iterations == 1);
    assert(std::abs(exact.r - r_star) < opts.tol_r);
    check_bracket(exact);

    // Known price away from the midpoint, where demand rises with r. Each candidate
    // restarts the distribution, so the price is recovered from any bisection history.
    double r_known = 0.035;
    MarketEvaluation at_known = demand_solver.evaluate(r_known, opts);
    std::cout << "Demand at r=" << r_known << ": " << at_known.demand << std::endl;
    assert(at_known.demand > -1.0);
    assert(demand_solver.evaluate(0.5 * (opts.r_low + r_known), opts).demand < at_known.demand);
    BondMarket known(at_known.demand);
    RecordingProgressSink sink;
    EquilibriumResult found = EquilibriumSolver(grid, income, known, beta, gamma).solve(opts, sink);
    std::cout << "Known-price run: r=" << found.r << " status " << to_string(found.report.status)
              << " excess " << found.excess << std::endl;
    assert(found.report.converged());
    assert(std::abs(found.r - r_known) < 1e-3);
    assert(std::abs(found.excess) < opts.tol_r);
    check_bracket(found);
    assert(sink.count(Stage::Market) >= found.report.iterations);

    // Same answer without reusing the value function between candidates
    EquilibriumOptions cold = opts;
    cold.warm_start = false;
    EquilibriumResult found_cold = EquilibriumSolver(grid, income, known, beta, gamma).solve(cold);
    assert(found_cold.report.converged());
    assert(std::abs(found_cold.r - found.r) < 1e-3);

    // 2. Iteration budget and inner failures are results, not exceptions
    EquilibriumOptions capped = opts;
    capped.max_iter = 1;
    EquilibriumResult one = EquilibriumSolver(grid, income, known, beta, gamma).solve(capped);
    assert(one.report.iterations == 1);
    assert(one.report.converged() || one.report.status == ConvergenceStatus::MaxIterations);

    EquilibriumOptions weak = opts;
    weak.vfi.max_iter = 2;
    weak.max_iter = 4;
    EquilibriumResult lenient = solver.solve(weak);
    assert(lenient.inner_failures == lenient.report.iterations);
    weak.strict_inner = true;
    EquilibriumResult strict = solver.solve(weak);
    assert(strict.report.status == ConvergenceStatus::InnerFailure);
    assert(strict.report.iterations == 1);

    // 3. Bad brackets
    bool thrown = false;
    EquilibriumOptions inverted = opts;
    inverted.r_low = 0.05;
    try { solver.solve(inverted); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    // Preferences are checked when the solver is built
    thrown = false;
    try { EquilibriumSolver patient(grid, income, target, 1.0, gamma); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);
    thrown = false;
    try { EquilibriumSolver flat(grid, income, target, beta, -2.0); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    // 4. Benchmark Huggett economy
    std::cout << "Solving benchmark Huggett economy..." << std::endl;
    AssetGrid hgrid = GridGenerator::generate("uniform", -3.0, 24.0, 50);
    IncomeProcess hinc = IncomeProcessFactory::make_tauchen_hussey(3, 0.95, std::sqrt(0.015));
    double hbeta = 0.993362;
    BondMarket hzero_supply(0.0);
    EquilibriumOptions hopts;
    hopts.r_low = -1.0;
    hopts.r_high = 1.0 / hbeta - 1.0;
    EquilibriumResult h = EquilibriumSolver(hgrid, hinc, hzero_supply, hbeta, 3.0).solve(hopts);
    std::cout << "Huggett r=" << h.r << " status " << to_string(h.report.status)
              << " iters " << h.report.iterations << " excess " << h.excess << std::endl;
    assert(h.r > hopts.r_low && h.r < hopts.r_high);
    assert(h.report.converged() || h.report.status == ConvergenceStatus::BracketExhausted);
    check_bracket(h);
    assert(h.household.report.converged() && h.distribution.report.converged());
    for(int idx=0; idx<hgrid.size * hinc.n_z; ++idx) {
        assert(h.household.policy[idx] >= 0);
        if (idx > 0 && idx % hgrid.size != 0)
            assert(h.household.value[idx] >= h.household.value[idx - 1] - 1e-9);
    }

    // 5. Capital market rule
    CapitalMarket firm(0.36, 0.08);
    assert(firm.capital_demand(0.02) > firm.capital_demand(0.04));
    assert(firm.wage(0.02) > firm.wage(0.04));
    assert(std::abs(firm.min_rate() + 0.08) < 1e-15);
    double K = firm.capital_demand(0.03);
    assert(std::abs(0.36 * std::pow(K, -0.64) - 0.08 - 0.03) < 1e-10);
    assert(std::abs(firm.output(0.03) - (0.03 + 0.08) * K - firm.wage(0.03)) < 1e-10);
    thrown = false;
    try { firm.capital_demand(-0.08); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);
    thrown = false;
    try { CapitalMarket bad(1.2, 0.08); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    // 6. Aiyagari equilibrium lies between -delta and the rate of time preference
    std::cout << "Solving Aiyagari economy..." << std::endl;
    AssetGrid agrid = GridGenerator::generate("power", 0.0, 60.0, 60, 2.0);
    IncomeProcess ainc = IncomeProcessFactory::make_tauchen_hussey(3, 0.9, 0.2);
    EquilibriumOptions aopts;
    aopts.r_low = -0.08;
    aopts.r_high = 1.0 / 0.96 - 1.0;
    aopts.tol_r = 1e-3;
    EquilibriumResult a = EquilibriumSolver(agrid, ainc, firm, 0.96, 2.0).solve(aopts);
    std::cout << "Aiyagari r=" << a.r << " K=" << a.supply << " status " << to_string(a.report.status) << std::endl;
    assert(a.r > aopts.r_low && a.r < aopts.r_high);
    assert(std::abs(a.w - firm.wage(a.r)) < 1e-12);
    check_bracket(a, aopts.tol_r);

    std::cout << "SUCCESS: market clearing verified." << std::endl;
    return 0;
}
