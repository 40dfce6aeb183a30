#pragma once
#include <memory>
#include "steady_state.h"
#include "../Params.hpp"
#include "../Progress.hpp"
#include "../config/ModelConfig.h"
#include "../solver/transition_path.h"

namespace Bewley {

struct TransitionRun {
    SteadyStateResult initial;
    SteadyStateResult terminal;
    TransitionResult path;
};

/**
 * Facade over the nested solver: builds the income chain, grid and market rule
 * once from a validated configuration and runs stationary or transition solves.
 */
class BewleyEngine {
public:
    explicit BewleyEngine(const ModelConfig& config, ProgressSink* sink = nullptr);
    explicit BewleyEngine(const BewleyParams& params, ProgressSink* sink = nullptr);

    BewleyEngine(const BewleyEngine&) = delete;
    BewleyEngine& operator=(const BewleyEngine&) = delete;

    // Stationary equilibrium with the borrowing limit at the grid floor
    SteadyStateResult solve_steady_state() const;

    // Stationary equilibrium with a tighter limit (>= grid floor) on the same grid
    SteadyStateResult solve_steady_state(double borrowing_limit) const;

    // Initial and terminal equilibria plus the path between them (config.transition)
    TransitionRun solve_transition() const;

    EquilibriumOptions equilibrium_options(int min_choice) const;

    const ModelConfig& config() const { return config_; }
    const AssetGrid& grid() const { return grid_; }
    const IncomeProcess& income() const { return income_; }
    const MarketRule& market() const { return *market_; }

private:
    ModelConfig config_;
    NullProgressSink quiet_;
    ProgressSink* sink_;
    IncomeProcess income_;
    AssetGrid grid_;
    std::unique_ptr<MarketRule> market_;
};

} // namespace Bewley
