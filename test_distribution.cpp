#include <iostream>
#include <vector>
#include <cassert>
#include <cmath>
#include "src/aggregator/distribution.h"
#include "src/solver/HouseholdSolver.hpp"
#include "src/blocks/IncomeProcessFactory.hpp"
#include "src/grid/grid_generator.h"
#include "src/errors.hpp"

using namespace Bewley;

static double total(const Vector& D) {
    double s = 0.0;
    for(double d : D) s += d;
    return s;
}

int main() {
    std::cout << "Testing DistributionAggregator..." << std::endl;

    AssetGrid grid = GridGenerator::generate("uniform", 0.0, 8.0, 30);
    IncomeProcess income = IncomeProcessFactory::make_tauchen_hussey(3, 0.8, 0.2);
    HouseholdSolver hh(grid, income, 0.95, 2.0);
    HouseholdSolution sol = hh.solve(Prices{0.03, 1.0}, VfiOptions());
    assert(sol.report.converged());

    int na = grid.size;
    int size = na * income.n_z;

    // 1. Mass conserved by every sweep
    Vector D = DistributionAggregator::uniform(na, income.n_z);
    for(int t=0; t<50; ++t) {
        D = DistributionAggregator::forward_step(D, sol.policy, income, na);
        assert(std::abs(total(D) - 1.0) < 1e-9);
        for(double d : D) assert(d >= 0.0);
    }

    // 2. Stationary distribution
    RecordingProgressSink sink;
    DistributionResult res = DistributionAggregator::compute_stationary_distribution(
        sol.policy, income, na, DistributionOptions(), nullptr, sink);
    std::cout << "Dist iterations: " << res.report.iterations << " resid " << res.report.residual << std::endl;
    assert(res.report.converged());
    assert((int)res.D.size() == size);
    assert(std::abs(total(res.D) - 1.0) < 1e-9);
    assert(sink.count(Stage::Distribution) == 1);

    // Income marginal matches the chain's stationary distribution
    for(int j=0; j<income.n_z; ++j) {
        double m = 0.0;
        for(int i=0; i<na; ++i) m += res.D[j*na + i];
        assert(std::abs(m - income.stationary[j]) < 1e-6);
    }

    // 3. Fixed point: restarting from the result changes nothing, warm start untouched
    Vector warm = res.D;
    DistributionResult again = DistributionAggregator::compute_stationary_distribution(
        sol.policy, income, na, DistributionOptions(), &warm);
    assert(again.report.converged());
    assert(warm == res.D);
    for(int k=0; k<size; ++k) assert(std::abs(again.D[k] - res.D[k]) < 1e-9);

    // 4. Budget exhausted: reported, not thrown
    DistributionOptions one;
    one.max_iter = 1;
    DistributionResult partial = DistributionAggregator::compute_stationary_distribution(sol.policy, income, na, one);
    assert(partial.report.status == ConvergenceStatus::MaxIterations);
    assert(std::abs(total(partial.D) - 1.0) < 1e-9);

    // 5. Aggregates
    double A = DistributionAggregator::aggregate_assets(res.D, grid, income.n_z);
    assert(A >= grid.min() && A <= grid.max());
    assert(std::abs(DistributionAggregator::aggregate(res.D, sol.a_pol) - A) < 1e-6);

    // 6. Invalid input and broken invariants
    bool thrown = false;
    Vector bad(size, 2.0 / size);
    try {
        DistributionAggregator::compute_stationary_distribution(sol.policy, income, na, DistributionOptions(), &bad);
    } catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { DistributionAggregator::check_mass(bad, "test"); } catch (const InvariantViolation&) { thrown = true; }
    assert(thrown);

    thrown = false;
    std::vector<int> broken = sol.policy;
    broken[0] = na;
    try {
        DistributionAggregator::forward_step(DistributionAggregator::uniform(na, income.n_z), broken, income, na);
    } catch (const InvariantViolation&) { thrown = true; }
    assert(thrown);

    std::cout << "SUCCESS: stationary distribution verified." << std::endl;
    return 0;
}
