#pragma once
#include <string>
#include <vector>

namespace Bewley {

using Vector = std::vector<double>;

enum class ConvergenceStatus {
    Converged,
    MaxIterations,     // iteration budget exhausted
    BracketExhausted,  // bisection bracket collapsed before |excess| < tol
    InnerFailure       // an inner solve did not converge (strict mode)
};

inline const char* to_string(ConvergenceStatus s) {
    switch (s) {
        case ConvergenceStatus::Converged:        return "converged";
        case ConvergenceStatus::MaxIterations:    return "max_iterations";
        case ConvergenceStatus::BracketExhausted: return "bracket_exhausted";
        case ConvergenceStatus::InnerFailure:     return "inner_failure";
    }
    return "unknown";
}

// Outcome of one iterative solve: last residual and number of sweeps taken.
struct ConvergenceReport {
    ConvergenceStatus status = ConvergenceStatus::MaxIterations;
    int iterations = 0;
    double residual = 0.0;

    bool converged() const { return status == ConvergenceStatus::Converged; }
};

// Interest rate with the wage implied by the market rule
struct Prices {
    double r = 0.0;
    double w = 1.0;
};

} // namespace Bewley
