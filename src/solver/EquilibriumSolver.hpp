#pragma once
#include <cmath>
#include <string>
#include <utility>
#include <vector>
#include "HouseholdSolver.hpp"
#include "../aggregator/distribution.h"
#include "../blocks/MarketBlocks.hpp"
#include "../Progress.hpp"
#include "../errors.hpp"

namespace Bewley {

struct EquilibriumOptions {
    double r_low = -1.0;
    double r_high = 0.0;
    double tol_r = 1e-4;        // |excess demand| to accept
    int max_iter = 60;
    double tol_bracket = 1e-10; // stop once r_high - r_low falls below this
    bool warm_start = true;     // reuse the previous candidate's value function
    bool strict_inner = false;  // stop on the first inner non-convergence
    int min_choice = 0;         // lowest admissible a' index (borrowing limit)
    VfiOptions vfi;
    DistributionOptions dist;
};

// Household block, distribution and market aggregates at one candidate rate
struct MarketEvaluation {
    Prices prices;
    HouseholdSolution household;
    DistributionResult distribution;
    double demand = 0.0;
    double supply = 0.0;
    double excess = 0.0;
};

struct EquilibriumResult {
    double r = 0.0;
    double w = 1.0;
    double demand = 0.0;
    double supply = 0.0;
    double excess = 0.0;
    double r_low = 0.0;   // final bracket
    double r_high = 0.0;
    HouseholdSolution household;
    DistributionResult distribution;
    ConvergenceReport report;
    int inner_failures = 0;
    std::vector<double> r_path;      // every candidate tried, in order
    std::vector<double> excess_path;
};

/**
 * Outer market-clearing loop: bisection on r.
 *
 * Each candidate runs value-function iteration and distribution iteration to
 * completion. Too much saving (excess > 0) moves r_high down to the candidate,
 * too little moves r_low up. Exhausting max_iter or collapsing the bracket is
 * returned as a non-converged result with the last iterate.
 */
class EquilibriumSolver {
    const AssetGrid& grid;
    const IncomeProcess& income;
    const MarketRule& market;
    HouseholdSolver household;

public:
    EquilibriumSolver(const AssetGrid& g, const IncomeProcess& inc, const MarketRule& m,
                      double beta, double gamma)
        : grid(g), income(inc), market(m), household(g, inc, beta, gamma) {}

    const HouseholdSolver& household_solver() const { return household; }

    MarketEvaluation evaluate(double r, const EquilibriumOptions& opts,
                              const Vector* value_guess = nullptr,
                              const Vector* dist_guess = nullptr,
                              ProgressSink& sink = null_sink()) const {
        MarketEvaluation ev;
        ev.prices = market.prices(r);
        ev.household = household.solve(ev.prices, opts.vfi, value_guess, opts.min_choice, sink);
        ev.distribution = DistributionAggregator::compute_stationary_distribution(
            ev.household.policy, income, grid.size, opts.dist, dist_guess, sink);
        ev.demand = DistributionAggregator::aggregate_assets(ev.distribution.D, grid, income.n_z);
        ev.supply = market.asset_supply(r);
        ev.excess = ev.demand - ev.supply;
        return ev;
    }

    EquilibriumResult solve(const EquilibriumOptions& opts, ProgressSink& sink = null_sink()) const {
        if (!(opts.r_low < opts.r_high)) {
            throw ConfigurationError("price bracket must satisfy r_low < r_high");
        }
        if (opts.r_low < market.min_rate()) {
            throw ConfigurationError("r_low lies below the lowest rate the " + market.name() + " market supports");
        }
        if (opts.max_iter < 1) throw ConfigurationError("bisection needs max_iter >= 1");

        EquilibriumResult res;
        double lo = opts.r_low;
        double hi = opts.r_high;
        bool decided = false;

        MarketEvaluation last;
        Vector value_ws;
        bool have_ws = false;

        int iter = 0;
        while (iter < opts.max_iter) {
            double r = 0.5 * (lo + hi);
            ++iter;

            // Only the value function carries over. The policy chain at a new price can have
            // several closed sets, so a carried distribution could stay trapped in the old one.
            const Vector* v0 = (opts.warm_start && have_ws) ? &value_ws : nullptr;
            last = evaluate(r, opts, v0, nullptr, sink);

            res.r_path.push_back(r);
            res.excess_path.push_back(last.excess);
            sink.on_progress({Stage::Market, iter, last.excess, r, ""});

            bool inner_ok = last.household.report.converged() && last.distribution.report.converged();
            if (!inner_ok) {
                ++res.inner_failures;
                sink.on_progress({Stage::Market, iter, last.excess, r, "inner solve did not converge"});
                if (opts.strict_inner) {
                    res.report.status = ConvergenceStatus::InnerFailure;
                    decided = true;
                    break;
                }
            }

            // Copy for the next candidate; `last` stays untouched
            value_ws = last.household.value;
            have_ws = true;

            if (std::abs(last.excess) < opts.tol_r) {
                res.report.status = ConvergenceStatus::Converged;
                decided = true;
                break;
            }

            // Too much desired saving: the rate must fall
            if (last.excess > 0.0) hi = r;
            else lo = r;

            if (hi - lo < opts.tol_bracket) {
                res.report.status = ConvergenceStatus::BracketExhausted;
                decided = true;
                break;
            }
        }
        if (!decided) res.report.status = ConvergenceStatus::MaxIterations;

        res.report.iterations = iter;
        res.report.residual = std::abs(last.excess);
        res.r = last.prices.r;
        res.w = last.prices.w;
        res.demand = last.demand;
        res.supply = last.supply;
        res.excess = last.excess;
        res.r_low = lo;
        res.r_high = hi;
        res.household = std::move(last.household);
        res.distribution = std::move(last.distribution);

        sink.on_progress({Stage::Market, iter, res.excess, res.r,
                          std::string("finished: ") + to_string(res.report.status)});
        return res;
    }
};

} // namespace Bewley
