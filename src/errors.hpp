#pragma once
#include <stdexcept>
#include <string>

namespace Bewley {

// Invalid model parameters. Raised before any solve starts.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument("ConfigurationError: " + what) {}
};

// Degenerate income chain (a transition row underflowed).
class DiscretizationError : public std::runtime_error {
public:
    explicit DiscretizationError(const std::string& what)
        : std::runtime_error("DiscretizationError: " + what) {}
};

class InvalidGridError : public std::invalid_argument {
public:
    explicit InvalidGridError(const std::string& what)
        : std::invalid_argument("InvalidGridError: " + what) {}
};

// Broken internal invariant (lost mass, non-stochastic row).
// Indicates a defect in the solver, never caught inside the library.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::logic_error("InvariantViolation: " + what) {}
};

inline void ensure(bool condition, const std::string& what) {
    if (!condition) throw InvariantViolation(what);
}

} // namespace Bewley
