#pragma once
#include <cmath>
#include <string>
#include "../bewley/types.h"
#include "../errors.hpp"

namespace Bewley {

/**
 * MarketRule: the supply side of the asset market.
 *
 * Maps a candidate interest rate to the wage households earn per unit of
 * effective labor and to the aggregate asset supply their savings must absorb.
 * Excess demand = household asset demand - asset_supply(r).
 */
class MarketRule {
public:
    virtual ~MarketRule() = default;

    virtual std::string name() const = 0;
    virtual double wage(double r) const = 0;
    virtual double asset_supply(double r) const = 0;

    // Lowest rate the rule is defined for (exclusive)
    virtual double min_rate() const { return -1.0; }

    Prices prices(double r) const {
        Prices p;
        p.r = r;
        p.w = wage(r);
        return p;
    }
};

/**
 * BondMarket (Huggett 1993): pure exchange economy.
 * Income is the endowment itself (w = 1) and net bond supply is fixed.
 */
class BondMarket : public MarketRule {
public:
    explicit BondMarket(double bond_supply = 0.0) : supply_(bond_supply) {}

    std::string name() const override { return "huggett"; }
    double wage(double) const override { return 1.0; }
    double asset_supply(double) const override { return supply_; }

private:
    double supply_;
};

/**
 * CapitalMarket (Aiyagari 1994): Cobb-Douglas firm Y = A K^alpha L^(1-alpha).
 *
 *   r + delta = alpha A (K/L)^(alpha-1)  =>  K(r) = L (alpha A / (r + delta))^(1/(1-alpha))
 *   w(r)      = (1 - alpha) A (K(r)/L)^alpha
 *
 * L is aggregate effective labor (1 under the income normalization).
 */
class CapitalMarket : public MarketRule {
public:
    CapitalMarket(double alpha, double delta, double tfp = 1.0, double labor = 1.0)
        : alpha_(alpha), delta_(delta), tfp_(tfp), labor_(labor) {
        if (!(alpha > 0.0 && alpha < 1.0)) throw ConfigurationError("alpha must lie in (0, 1)");
        if (!(delta >= 0.0 && delta <= 1.0)) throw ConfigurationError("delta must lie in [0, 1]");
        if (!(tfp > 0.0)) throw ConfigurationError("tfp must be positive");
        if (!(labor > 0.0)) throw ConfigurationError("aggregate labor must be positive");
    }

    std::string name() const override { return "aiyagari"; }

    double capital_demand(double r) const {
        if (!(r + delta_ > 0.0)) throw ConfigurationError("capital demand undefined for r <= -delta");
        return labor_ * std::pow(alpha_ * tfp_ / (r + delta_), 1.0 / (1.0 - alpha_));
    }

    double wage(double r) const override {
        double k = capital_demand(r) / labor_;
        return (1.0 - alpha_) * tfp_ * std::pow(k, alpha_);
    }

    double asset_supply(double r) const override { return capital_demand(r); }

    double min_rate() const override { return -delta_; }

    double output(double r) const {
        return tfp_ * std::pow(capital_demand(r), alpha_) * std::pow(labor_, 1.0 - alpha_);
    }

private:
    double alpha_;
    double delta_;
    double tfp_;
    double labor_;
};

} // namespace Bewley
