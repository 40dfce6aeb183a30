#pragma once
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../AssetGrid.hpp"
#include "../Params.hpp"
#include "../Progress.hpp"
#include "../bewley/types.h"
#include "../errors.hpp"

namespace Bewley {

// Value and greedy policy on the (asset, income) grid, flattened iz * n_a + ia
struct HouseholdSolution {
    Vector value;
    std::vector<int> policy;  // next-period asset index
    Vector a_pol;             // next-period asset level
    Vector c_pol;             // consumption
    ConvergenceReport report;
};

struct VfiOptions {
    double tol = 1e-6;
    int max_iter = 10000;
    int log_every = 0;  // 0 = only the summary event
};

class HouseholdSolver {
    const AssetGrid& grid;
    const IncomeProcess& income;
    double beta;
    double gamma;

public:
    static constexpr double c_floor = 1e-10;
    static constexpr double penalty = -1e10;

    HouseholdSolver(const AssetGrid& g, const IncomeProcess& inc, double beta_, double gamma_)
        : grid(g), income(inc), beta(beta_), gamma(gamma_) {
        if (!(beta > 0.0 && beta < 1.0)) throw ConfigurationError("beta must lie in (0, 1)");
        if (!(gamma > 0.0) || !std::isfinite(gamma)) throw ConfigurationError("gamma must be positive");
        if (grid.size < 2) throw ConfigurationError("asset grid needs at least 2 nodes");
        if (income.n_z < 1 || (int)income.Pi_flat.size() != income.n_z * income.n_z ||
            (int)income.z_grid.size() != income.n_z) {
            throw ConfigurationError("income process is not a complete n_z-state chain");
        }
    }

    StateSpace states() const { return StateSpace(grid.size, income.n_z); }

    // CRRA utility; non-positive consumption gets the penalty instead of NaN/inf
    double u(double c) const {
        if (c <= c_floor) return penalty;
        if (std::abs(gamma - 1.0) < 1e-10) return std::log(c);
        return std::pow(c, 1.0 - gamma) / (1.0 - gamma);
    }

    double resources(const Prices& p, int ia, int iz) const {
        return (1.0 + p.r) * grid.nodes[ia] + p.w * income.z_grid[iz];
    }

    // E[V(a', y') | y] for every (a', y): one product V * Pi^T
    Vector expected_value(const Vector& V) const {
        int na = grid.size;
        int nz = income.n_z;
        using RowMat = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
        Eigen::Map<const Eigen::MatrixXd> Vm(V.data(), na, nz);
        Eigen::Map<const RowMat> Pi(income.Pi_flat.data(), nz, nz);

        Vector EV(V.size());
        Eigen::Map<Eigen::MatrixXd> EVm(EV.data(), na, nz);
        EVm.noalias() = Vm * Pi.transpose();
        return EV;
    }

    /**
     * One Bellman sweep.
     *
     * V_out(a,y) = max_{a' >= grid[min_choice]} u(a(1+r) + w y - a') + beta * E[V_next(a',y') | y]
     * Ties go to the lowest index. Returns the sup-norm change over rows ia >= diff_from.
     */
    double bellman_step(const Prices& p, const Vector& V_next, int min_choice,
                        Vector& V_out, std::vector<int>& pol_out, int diff_from = 0) const {
        int na = grid.size;
        int nz = income.n_z;
        int first = std::min(std::max(min_choice, 0), na - 1);

        Vector EV = expected_value(V_next);
        V_out.assign(na * nz, 0.0);
        pol_out.assign(na * nz, first);

        double max_diff = 0.0;
        for (int iz = 0; iz < nz; ++iz) {
            int offset = iz * na;
            for (int ia = 0; ia < na; ++ia) {
                double cash = resources(p, ia, iz);

                double best = -std::numeric_limits<double>::infinity();
                int best_k = first;
                bool feasible_seen = false;
                for (int k = first; k < na; ++k) {
                    double c = cash - grid.nodes[k];
                    // Grid is increasing, so once c hits the floor every later choice does too.
                    // Those are dominated by any feasible choice.
                    if (c <= c_floor && feasible_seen) break;
                    if (c > c_floor) feasible_seen = true;

                    double val = u(c) + beta * EV[offset + k];
                    if (val > best) {
                        best = val;
                        best_k = k;
                    }
                }

                int idx = offset + ia;
                V_out[idx] = best;
                pol_out[idx] = std::min(std::max(best_k, first), na - 1);

                if (ia >= diff_from) {
                    double d = std::abs(best - V_next[idx]);
                    if (d > max_diff) max_diff = d;
                }
            }
        }
        return max_diff;
    }

    /**
     * Value function iteration at fixed prices.
     *
     * Stops when ||V_new - V_old||_inf < tol over rows ia >= min_choice (rows below the
     * limit are unreachable) or after max_iter sweeps. Non-convergence is reported in
     * solution.report, never thrown.
     */
    HouseholdSolution solve(const Prices& p, const VfiOptions& opts,
                            const Vector* initial_value = nullptr, int min_choice = 0,
                            ProgressSink& sink = null_sink()) const {
        StateSpace ss = states();
        if (min_choice < 0 || min_choice >= ss.n_a) {
            throw std::invalid_argument("min_choice out of range: " + std::to_string(min_choice));
        }
        if (opts.max_iter < 1) throw std::invalid_argument("VFI needs max_iter >= 1");

        Vector V_old;
        if (initial_value != nullptr) {
            if ((int)initial_value->size() != ss.size) {
                throw std::invalid_argument("initial value function has wrong size");
            }
            V_old = *initial_value;
        } else {
            V_old.assign(ss.size, 0.0);
        }

        HouseholdSolution sol;
        Vector V_new;
        std::vector<int> pol;
        double diff = std::numeric_limits<double>::infinity();
        int iter = 0;

        while (iter < opts.max_iter) {
            diff = bellman_step(p, V_old, min_choice, V_new, pol, min_choice);
            ++iter;
            V_old.swap(V_new);

            if (opts.log_every > 0 && iter % opts.log_every == 0) {
                sink.on_progress({Stage::Household, iter, diff, p.r, ""});
            }
            if (diff < opts.tol) break;
        }

        sol.value = V_old;
        sol.policy = pol;
        sol.report.iterations = iter;
        sol.report.residual = diff;
        sol.report.status = (diff < opts.tol) ? ConvergenceStatus::Converged
                                              : ConvergenceStatus::MaxIterations;
        derive_levels(p, sol);

        sink.on_progress({Stage::Household, iter, diff, p.r,
                          sol.report.converged() ? "converged" : "max iterations reached"});
        return sol;
    }

    // Asset and consumption levels implied by the index policy
    void derive_levels(const Prices& p, HouseholdSolution& sol) const {
        StateSpace ss = states();
        sol.a_pol.assign(ss.size, 0.0);
        sol.c_pol.assign(ss.size, 0.0);
        for (int iz = 0; iz < ss.n_z; ++iz) {
            for (int ia = 0; ia < ss.n_a; ++ia) {
                int idx = ss.idx(ia, iz);
                sol.a_pol[idx] = grid.nodes[sol.policy[idx]];
                sol.c_pol[idx] = resources(p, ia, iz) - sol.a_pol[idx];
            }
        }
    }
};

} // namespace Bewley
