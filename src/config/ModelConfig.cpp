#include "ModelConfig.h"
#include "../errors.hpp"
#include "../grid/grid_generator.h"
#include "../blocks/IncomeProcessFactory.hpp"
#include <algorithm>
#include <cmath>

namespace Bewley {

namespace {

int get_int(const BewleyParams& p, const std::string& key, int default_val) {
    if (!p.has(key)) return default_val;
    double v = p.get(key, 0.0);
    if (!std::isfinite(v) || v != std::floor(v) || std::abs(v) > 1e9) {
        throw ConfigurationError(key + " must be an integer (got " + std::to_string(v) + ")");
    }
    return static_cast<int>(v);
}

bool get_flag(const BewleyParams& p, const std::string& key, bool default_val) {
    if (!p.has(key)) return default_val;
    return p.get(key, 0.0) != 0.0;
}

void require(bool ok, const std::string& what) {
    if (!ok) throw ConfigurationError(what);
}

bool finite_positive(double x) { return std::isfinite(x) && x > 0.0; }

} // namespace

ModelConfig ModelConfig::from_params(const BewleyParams& params) {
    ModelConfig c;

    // 1. Household
    c.household.beta = params.get("beta", c.household.beta);
    c.household.gamma = params.get("gamma", c.household.gamma);

    // 2. Income process
    c.income.n_z = get_int(params, "n_z", c.income.n_z);
    c.income.rho = params.get("rho", c.income.rho);
    c.income.sigma = params.get("sigma", c.income.sigma);
    c.income.mu = params.get("mu", c.income.mu);
    c.income.width = params.get("width", c.income.width);

    // 3. Asset grid
    c.grid.kind = params.grid_kind;
    c.grid.a_min = params.get("a_min", c.grid.a_min);
    c.grid.a_max = params.get("a_max", c.grid.a_max);
    c.grid.n_a = get_int(params, "n_a", c.grid.n_a);
    c.grid.curvature = params.get("curvature", c.grid.curvature);

    // 4. Market
    if (params.market == "huggett" || params.market == "Huggett") {
        c.market.kind = MarketKind::Huggett;
    } else if (params.market == "aiyagari" || params.market == "Aiyagari") {
        c.market.kind = MarketKind::Aiyagari;
    } else {
        throw ConfigurationError("unknown market type: " + params.market);
    }
    c.market.bond_supply = params.get("bond_supply", c.market.bond_supply);
    c.market.alpha = params.get("alpha", c.market.alpha);
    c.market.delta = params.get("delta", c.market.delta);
    c.market.tfp = params.get("tfp", c.market.tfp);

    double default_low = (c.market.kind == MarketKind::Huggett) ? -1.0 : -c.market.delta;
    c.market.r_low = params.get("r_low", default_low);
    double default_high = (c.household.beta > 0.0) ? 1.0 / c.household.beta - 1.0 : 0.0;
    c.market.r_high = params.get("r_high", default_high);

    // 5. Solver
    c.solver.tol_v = params.get("tol_v", c.solver.tol_v);
    c.solver.max_iter_v = get_int(params, "max_iter_v", c.solver.max_iter_v);
    c.solver.tol_d = params.get("tol_d", c.solver.tol_d);
    c.solver.max_iter_d = get_int(params, "max_iter_d", c.solver.max_iter_d);
    c.solver.tol_r = params.get("tol_r", c.solver.tol_r);
    c.solver.max_iter_r = get_int(params, "max_iter_r", c.solver.max_iter_r);
    c.solver.tol_bracket = params.get("tol_bracket", c.solver.tol_bracket);
    c.solver.warm_start = get_flag(params, "warm_start", c.solver.warm_start);
    c.solver.strict_inner = get_flag(params, "strict_inner", c.solver.strict_inner);
    c.solver.log_every = get_int(params, "log_every", c.solver.log_every);

    // 6. Transition path
    c.transition.periods = get_int(params, "T", c.transition.periods);
    c.transition.limit_initial = params.get("limit_initial", c.grid.a_min);
    c.transition.limit_terminal = params.get("limit_terminal", c.grid.a_min);
    c.transition.adjust_periods = get_int(params, "adjust_periods", c.transition.adjust_periods);
    c.transition.tol = params.get("tol_path", c.transition.tol);
    c.transition.max_iter = get_int(params, "max_iter_path", c.transition.max_iter);
    c.transition.max_bisect = get_int(params, "max_bisect_path", c.transition.max_bisect);

    c.validate();
    return c;
}

void ModelConfig::validate() const {
    const auto& h = household;
    require(std::isfinite(h.beta) && h.beta > 0.0 && h.beta < 1.0, "beta must lie in (0, 1)");
    require(finite_positive(h.gamma), "gamma must be positive");

    require(income.n_z >= 1, "n_z must be >= 1");
    require(std::isfinite(income.rho) && std::abs(income.rho) < 1.0, "rho must lie in (-1, 1)");
    require(finite_positive(income.sigma), "sigma must be positive");
    require(std::isfinite(income.mu) && std::isfinite(income.width), "mu and width must be finite");

    require(grid.n_a >= 2, "grid size n_a must be >= 2");
    require(std::isfinite(grid.a_min) && std::isfinite(grid.a_max), "grid bounds must be finite");
    require(grid.a_max > grid.a_min, "a_max must exceed a_min");
    require(grid.kind == "uniform" || grid.kind == "log_spaced" || grid.kind == "power",
            "unknown grid kind: " + grid.kind);
    require(grid.kind != "power" || grid.curvature >= 1.0, "power grid curvature must be >= 1");

    const auto& s = solver;
    require(finite_positive(s.tol_v) && finite_positive(s.tol_d) && finite_positive(s.tol_r) &&
            finite_positive(s.tol_bracket), "tolerances must be positive");
    require(s.max_iter_v >= 1 && s.max_iter_d >= 1 && s.max_iter_r >= 1, "iteration caps must be >= 1");
    require(s.log_every >= 0, "log_every must be >= 0");

    const auto& m = market;
    require(std::isfinite(m.r_low) && std::isfinite(m.r_high) && m.r_low < m.r_high, "r_low must be below r_high");
    require(std::isfinite(m.bond_supply), "bond_supply must be finite");
    if (m.kind == MarketKind::Huggett) {
        require(m.r_low >= -1.0, "r_low must be >= -1");
    } else {
        require(m.alpha > 0.0 && m.alpha < 1.0, "alpha must lie in (0, 1)");
        require(m.delta >= 0.0 && m.delta <= 1.0, "delta must lie in [0, 1]");
        require(finite_positive(m.tfp), "tfp must be positive");
        require(m.r_low >= -m.delta, "r_low must be >= -delta for the capital market");
    }

    const auto& t = transition;
    require(t.periods >= 0, "T must be >= 0");
    if (t.periods > 0) {
        require(t.periods >= 2, "T must be >= 2 for a transition path");
        require(t.adjust_periods >= 1 && t.adjust_periods <= t.periods, "adjust_periods must lie in [1, T]");
        require(finite_positive(t.tol), "tol_path must be positive");
        require(t.max_iter >= 1, "max_iter_path must be >= 1");
        require(t.max_bisect >= 1, "max_bisect_path must be >= 1");
        double loosest = std::min(t.limit_initial, t.limit_terminal);
        double tightest = std::max(t.limit_initial, t.limit_terminal);
        require(std::abs(loosest - grid.a_min) < 1e-12,
                "a_min must equal the looser of limit_initial and limit_terminal");
        require(tightest < grid.a_max, "borrowing limits must lie below a_max");
    }
}

std::unique_ptr<MarketRule> ModelConfig::make_market_rule() const {
    if (market.kind == MarketKind::Huggett) {
        return std::make_unique<BondMarket>(market.bond_supply);
    }
    return std::make_unique<CapitalMarket>(market.alpha, market.delta, market.tfp);
}

AssetGrid ModelConfig::make_grid() const {
    return GridGenerator::generate(grid.kind, grid.a_min, grid.a_max, grid.n_a, grid.curvature);
}

IncomeProcess ModelConfig::make_income(ProgressSink& sink) const {
    return IncomeProcessFactory::make_tauchen_hussey(income.n_z, income.rho, income.sigma,
                                                     income.mu, income.width, sink);
}

} // namespace Bewley
