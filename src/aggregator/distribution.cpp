#include "distribution.h"
#include "../errors.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace Bewley {

namespace {
constexpr double kMassTol = 1e-9;
}

Vector DistributionAggregator::uniform(int n_a, int n_z) {
    int size = n_a * n_z;
    return Vector(size, 1.0 / size);
}

Vector DistributionAggregator::forward_step(const Vector& D, const std::vector<int>& policy,
                                            const IncomeProcess& income, int n_a) {
    int nz = income.n_z;
    int size = n_a * nz;

    // Full redistribution: many (a,y) can land on the same target, so start from zero
    Vector D_next(size, 0.0);

    // Loop over current state (z_j, a_i)
    for (int j = 0; j < nz; ++j) {
        for (int i = 0; i < n_a; ++i) {
            int curr_idx = j * n_a + i;
            double mass = D[curr_idx];
            if (mass == 0.0) continue;

            int k = policy[curr_idx];
            ensure(k >= 0 && k < n_a, "policy index out of range at state " + std::to_string(curr_idx));

            // Distribute to next period z_next
            for (int next_j = 0; next_j < nz; ++next_j) {
                D_next[next_j * n_a + k] += mass * income.prob(j, next_j);
            }
        }
    }
    return D_next;
}

DistributionResult DistributionAggregator::compute_stationary_distribution(const std::vector<int>& policy,
                                                                           const IncomeProcess& income,
                                                                           int n_a,
                                                                           const DistributionOptions& opts,
                                                                           const Vector* initial,
                                                                           ProgressSink& sink) {
    int size = n_a * income.n_z;
    if ((int)policy.size() != size) {
        throw std::invalid_argument("policy size does not match the state space");
    }
    if (opts.max_iter < 1) throw std::invalid_argument("distribution iteration needs max_iter >= 1");

    // Own copy; the caller's warm start is never touched
    Vector D;
    if (initial != nullptr) {
        validate_initial(*initial, size);
        D = *initial;
    } else {
        D = uniform(n_a, income.n_z);
    }

    DistributionResult res;
    double diff = std::numeric_limits<double>::infinity();
    int iter = 0;

    while (iter < opts.max_iter) {
        Vector D_next = forward_step(D, policy, income, n_a);
        // Only floating-point drift survives the check; remove it so it cannot accumulate
        double mass = check_mass(D_next, "distribution sweep " + std::to_string(iter));
        for (double& d : D_next) d /= mass;

        diff = 0.0;
        for (int idx = 0; idx < size; ++idx) {
            double d = std::abs(D_next[idx] - D[idx]);
            if (d > diff) diff = d;
        }
        D.swap(D_next);
        ++iter;

        if (opts.log_every > 0 && iter % opts.log_every == 0) {
            sink.on_progress({Stage::Distribution, iter, diff, 0.0, ""});
        }
        if (diff < opts.tol) break;
    }

    res.D = D;
    res.report.iterations = iter;
    res.report.residual = diff;
    res.report.status = (diff < opts.tol) ? ConvergenceStatus::Converged
                                          : ConvergenceStatus::MaxIterations;

    sink.on_progress({Stage::Distribution, iter, diff, 0.0,
                      res.report.converged() ? "converged" : "max iterations reached"});
    return res;
}

double DistributionAggregator::aggregate_assets(const Vector& D, const AssetGrid& grid, int n_z) {
    int na = grid.size;
    double total = 0.0;
    for (int j = 0; j < n_z; ++j) {
        for (int i = 0; i < na; ++i) {
            total += D[j * na + i] * grid.nodes[i];
        }
    }
    return total;
}

double DistributionAggregator::aggregate(const Vector& D, const Vector& x) {
    if (D.size() != x.size()) throw std::invalid_argument("aggregate: size mismatch");
    double total = 0.0;
    for (size_t k = 0; k < D.size(); ++k) total += D[k] * x[k];
    return total;
}

double DistributionAggregator::check_mass(const Vector& D, const std::string& where) {
    double s = 0.0;
    for (double d : D) s += d;
    ensure(std::abs(s - 1.0) <= kMassTol, "mass not conserved in " + where + " (sum=" + std::to_string(s) + ")");
    return s;
}

void DistributionAggregator::validate_initial(const Vector& D, int size) {
    if ((int)D.size() != size) {
        throw std::invalid_argument("initial distribution has wrong size");
    }
    double s = 0.0;
    for (double d : D) {
        if (!(d >= 0.0)) throw std::invalid_argument("initial distribution has a negative entry");
        s += d;
    }
    if (std::abs(s - 1.0) > kMassTol) {
        throw std::invalid_argument("initial distribution does not sum to 1");
    }
}

} // namespace Bewley
