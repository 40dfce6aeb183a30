#pragma once

#include <algorithm>
#include <cmath>
#include <complex>
#include <vector>
#include <string>
#include <Eigen/Dense>
#include "../Params.hpp"
#include "../Progress.hpp"
#include "../errors.hpp"

namespace Bewley {

class IncomeProcessFactory {
public:
    struct Quadrature {
        std::vector<double> nodes;   // Hermite abscissae (weight exp(-x^2))
        std::vector<double> weights; // normalized to sum to 1
    };

    /**
     * @brief Gauss-Hermite rule via Golub-Welsch.
     *
     * The Jacobi matrix of the Hermite polynomials has zero diagonal and
     * off-diagonal sqrt(k/2). Its eigenvalues are the nodes; the squared first
     * components of the normalized eigenvectors are the weights divided by sqrt(pi).
     */
    static Quadrature gauss_hermite(int n) {
        Eigen::MatrixXd J = Eigen::MatrixXd::Zero(n, n);
        for(int k=1; k<n; ++k) {
            double b = std::sqrt(k / 2.0);
            J(k-1, k) = b;
            J(k, k-1) = b;
        }
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(J);
        if (es.info() != Eigen::Success) {
            throw DiscretizationError("Gauss-Hermite eigen decomposition failed (n=" + std::to_string(n) + ")");
        }

        Quadrature q;
        q.nodes.resize(n);
        q.weights.resize(n);
        for(int k=0; k<n; ++k) {
            q.nodes[k] = es.eigenvalues()(k);   // ascending
            double v0 = es.eigenvectors()(0, k);
            q.weights[k] = v0 * v0;
        }
        return q;
    }

    /**
     * @brief Tauchen-Hussey discretization of log y' = (1-rho) mu + rho log y + e, e ~ N(0, sigma^2).
     *
     * @param n_points Number of states
     * @param rho Persistence, |rho| < 1
     * @param sigma Shock standard deviation
     * @param mu Unconditional mean of log income
     * @param width If > 0, outermost nodes sit at mu +/- width * sigma_stationary.
     *              Otherwise Floden's base sigma is used.
     */
    static IncomeProcess make_tauchen_hussey(int n_points, double rho, double sigma, double mu = 0.0,
                                             double width = 0.0, ProgressSink& sink = null_sink()) {
        if (n_points < 1) throw ConfigurationError("income states n_z must be >= 1");
        if (!(std::abs(rho) < 1.0)) throw ConfigurationError("rho must lie in (-1, 1)");
        if (!(sigma > 0.0) || !std::isfinite(sigma)) throw ConfigurationError("sigma must be positive");
        if (!std::isfinite(mu) || !std::isfinite(width)) throw ConfigurationError("mu and width must be finite");

        IncomeProcess p;
        p.n_z = n_points;

        if (n_points == 1) {
            p.z_grid = {1.0};
            p.log_nodes = {mu};
            p.Pi_flat = {1.0};
            p.stationary = {1.0};
            return p;
        }

        // 1. Quadrature grid
        Quadrature q = gauss_hermite(n_points);
        double sigma_stat = sigma / std::sqrt(1.0 - rho * rho);
        double sigma_base;
        if (width > 0.0) {
            sigma_base = width * sigma_stat / (std::sqrt(2.0) * q.nodes.back());
        } else {
            double w = 0.5 + rho / 4.0;
            sigma_base = w * sigma + (1.0 - w) * sigma_stat;
        }

        std::vector<double> x(n_points);
        for(int j=0; j<n_points; ++j) {
            x[j] = mu + std::sqrt(2.0) * sigma_base * q.nodes[j];
        }

        // 2. Transition Matrix
        // Pi(i,j) = w_j * f(x_j | x_i) / f(x_j | base)
        std::vector<double> Pi(n_points * n_points);
        for(int i=0; i<n_points; ++i) {
            double cond_mean = (1.0 - rho) * mu + rho * x[i];
            double row_sum = 0.0;
            for(int j=0; j<n_points; ++j) {
                double num = normal_pdf(x[j], cond_mean, sigma);
                double den = normal_pdf(x[j], mu, sigma_base);
                double val = (den > 0.0) ? q.weights[j] * num / den : 0.0;
                Pi[i*n_points + j] = val;
                row_sum += val;
            }
            if (!(row_sum > 0.0) || !std::isfinite(row_sum)) {
                throw DiscretizationError("transition row " + std::to_string(i) +
                                          " has zero mass; sigma too small for the node spacing");
            }
            for(int j=0; j<n_points; ++j) Pi[i*n_points + j] /= row_sum;
        }
        check_stochastic(Pi, n_points);
        check_irreducible(Pi, n_points);

        // 3. Stationary distribution (left unit eigenvector)
        std::vector<double> pi_inf = stationary_distribution(Pi, n_points);

        // 4. Levels with E[y] = 1
        double mean = 0.0;
        for(int j=0; j<n_points; ++j) mean += pi_inf[j] * std::exp(x[j]);

        p.log_nodes = x;
        p.Pi_flat = Pi;
        p.stationary = pi_inf;
        p.z_grid.resize(n_points);
        for(int j=0; j<n_points; ++j) p.z_grid[j] = std::exp(x[j]) / mean;

        ProgressEvent ev{Stage::Income, 0, 0.0, 0.0, "Tauchen-Hussey n_z=" + std::to_string(n_points)};
        sink.on_progress(ev);
        return p;
    }

    // Unit-eigenvalue left eigenvector of the row-stochastic matrix Pi, normalized to sum 1.
    static std::vector<double> stationary_distribution(const std::vector<double>& Pi_flat, int n) {
        Eigen::MatrixXd P(n, n);
        for(int i=0; i<n; ++i)
            for(int j=0; j<n; ++j)
                P(i, j) = Pi_flat[i*n + j];

        Eigen::EigenSolver<Eigen::MatrixXd> es(P.transpose());
        if (es.info() != Eigen::Success) {
            throw DiscretizationError("eigen decomposition of the income chain failed");
        }

        int best = 0;
        int n_unit = 0;
        double best_gap = 1e300;
        for(int k=0; k<n; ++k) {
            double gap = std::abs(es.eigenvalues()(k) - std::complex<double>(1.0, 0.0));
            if (gap < unit_root_tol) ++n_unit;
            if (gap < best_gap) { best_gap = gap; best = k; }
        }
        // A repeated unit root means several closed classes and no unique stationary law
        if (n_unit > 1) {
            throw DiscretizationError("income chain has " + std::to_string(n_unit) +
                                      " unit eigenvalues; stationary distribution is not unique");
        }

        Eigen::VectorXd v = es.eigenvectors().col(best).real();
        double total = v.sum();
        if (std::abs(total) < 1e-14) {
            throw DiscretizationError("income chain has no normalizable stationary distribution");
        }
        v /= total;

        std::vector<double> out(n);
        for(int k=0; k<n; ++k) out[k] = std::max(v(k), 0.0);
        double s = 0.0;
        for(double d : out) s += d;
        for(double& d : out) d /= s;
        return out;
    }

    // Entries at or below this count as zero when checking that every state reaches every other
    static constexpr double negligible_prob = 1e-12;
    static constexpr double unit_root_tol = 1e-10;

private:
    static double normal_pdf(double x, double m, double s) {
        static const double inv_sqrt_2pi = 0.3989422804014327;
        double z = (x - m) / s;
        return inv_sqrt_2pi / s * std::exp(-0.5 * z * z);
    }

    static void check_stochastic(const std::vector<double>& Pi, int n) {
        for(int i=0; i<n; ++i) {
            double s = 0.0;
            for(int j=0; j<n; ++j) {
                ensure(Pi[i*n + j] >= 0.0, "negative transition probability");
                s += Pi[i*n + j];
            }
            ensure(std::abs(s - 1.0) < 1e-9, "transition row " + std::to_string(i) + " does not sum to 1");
        }
    }

    // Reachability from state 0 along edges with non-negligible mass, forward and backward.
    static void check_irreducible(const std::vector<double>& Pi, int n) {
        for(int dir=0; dir<2; ++dir) {
            std::vector<char> seen(n, 0);
            std::vector<int> stack(1, 0);
            seen[0] = 1;
            int reached = 1;
            while (!stack.empty()) {
                int i = stack.back();
                stack.pop_back();
                for(int j=0; j<n; ++j) {
                    double p = (dir == 0) ? Pi[i*n + j] : Pi[j*n + i];
                    if (!seen[j] && p > negligible_prob) {
                        seen[j] = 1;
                        ++reached;
                        stack.push_back(j);
                    }
                }
            }
            if (reached < n) {
                throw DiscretizationError("income chain is numerically reducible: " +
                                          std::to_string(n - reached) + " state(s) " +
                                          (dir == 0 ? "unreachable from" : "cannot return to") +
                                          " state 0; widen sigma or narrow the node width");
            }
        }
    }
};

} // namespace Bewley
