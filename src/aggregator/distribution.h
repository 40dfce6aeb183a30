#ifndef BEWLEY_DISTRIBUTION_AGGREGATOR_H
#define BEWLEY_DISTRIBUTION_AGGREGATOR_H

#include <string>
#include <vector>
#include "../AssetGrid.hpp"
#include "../Params.hpp"
#include "../Progress.hpp"
#include "../bewley/types.h"

namespace Bewley {

struct DistributionOptions {
    double tol = 1e-10;
    int max_iter = 100000;
    int log_every = 0;
};

struct DistributionResult {
    Vector D;                 // mass on (ia, iz), flattened iz * n_a + ia
    ConvergenceReport report;
};

class DistributionAggregator {
public:
    // Compute stationary distribution by iterating the policy-induced chain.
    // Input: policy (next-period asset index per state), income chain, optional warm start
    // Output: probability mass on each state summing to 1
    static DistributionResult compute_stationary_distribution(const std::vector<int>& policy,
                                                              const IncomeProcess& income,
                                                              int n_a,
                                                              const DistributionOptions& opts,
                                                              const Vector* initial = nullptr,
                                                              ProgressSink& sink = null_sink());

    // One sweep: D_next(policy(a,y), y') += D(a,y) * Pi(y,y'), from a zeroed target
    static Vector forward_step(const Vector& D, const std::vector<int>& policy,
                               const IncomeProcess& income, int n_a);

    static Vector uniform(int n_a, int n_z);

    // sum_{a,y} D(a,y) * a
    static double aggregate_assets(const Vector& D, const AssetGrid& grid, int n_z);

    // sum_{a,y} D(a,y) * x(a,y)
    static double aggregate(const Vector& D, const Vector& x);

    // Throws InvariantViolation unless |sum(D) - 1| <= 1e-9; returns the sum
    static double check_mass(const Vector& D, const std::string& where);

private:
    static void validate_initial(const Vector& D, int size);
};

} // namespace Bewley

#endif // BEWLEY_DISTRIBUTION_AGGREGATOR_H
