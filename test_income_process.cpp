#include <iostream>
#include <vector>
#include <cassert>
#include <cmath>
#include "src/blocks/IncomeProcessFactory.hpp"

using namespace Bewley;

static void check_chain(const IncomeProcess& p) {
    int n = p.n_z;
    assert((int)p.Pi_flat.size() == n * n);
    for(int i=0; i<n; ++i) {
        double s = 0.0;
        for(int j=0; j<n; ++j) {
            assert(p.prob(i, j) >= 0.0);
            s += p.prob(i, j);
        }
        assert(std::abs(s - 1.0) < 1e-9);
    }
    double ps = 0.0;
    for(double x : p.stationary) ps += x;
    assert(std::abs(ps - 1.0) < 1e-9);
    assert(std::abs(p.mean_income() - 1.0) < 1e-9);
}

int main() {
    std::cout << "Testing Tauchen-Hussey income process..." << std::endl;

    // 1. Gauss-Hermite: sum of weights 1, second moment 1/2 (weight exp(-x^2))
    auto q = IncomeProcessFactory::gauss_hermite(5);
    double ws = 0.0, m2 = 0.0;
    for(int k=0; k<5; ++k) {
        ws += q.weights[k];
        m2 += q.weights[k] * q.nodes[k] * q.nodes[k];
    }
    assert(std::abs(ws - 1.0) < 1e-12);
    assert(std::abs(m2 - 0.5) < 1e-10);
    assert(std::abs(q.nodes[2]) < 1e-12);

    // 2. Benchmark chain
    RecordingProgressSink sink;
    IncomeProcess p = IncomeProcessFactory::make_tauchen_hussey(3, 0.95, std::sqrt(0.015), 0.0, 0.0, sink);
    check_chain(p);
    assert(sink.count(Stage::Income) == 1);
    for(int j=1; j<3; ++j) assert(p.z_grid[j] > p.z_grid[j-1]);
    std::cout << "z = [" << p.z_grid[0] << ", " << p.z_grid[1] << ", " << p.z_grid[2] << "]" << std::endl;

    // Persistence shows on the diagonal
    for(int i=0; i<3; ++i)
        for(int j=0; j<3; ++j)
            if (j != i) assert(p.prob(i, i) > p.prob(i, j));

    // 3. Symmetry around mu = 0
    IncomeProcess s = IncomeProcessFactory::make_tauchen_hussey(5, 0.6, 0.2);
    check_chain(s);
    for(int i=0; i<5; ++i) {
        assert(std::abs(s.log_nodes[i] + s.log_nodes[4 - i]) < 1e-10);
        for(int j=0; j<5; ++j)
            assert(std::abs(s.prob(i, j) - s.prob(4 - i, 4 - j)) < 1e-10);
    }

    // 4. Explicit width and a negative rho
    check_chain(IncomeProcessFactory::make_tauchen_hussey(7, 0.9, 0.1, 0.0, 3.0));
    check_chain(IncomeProcessFactory::make_tauchen_hussey(4, -0.5, 0.3));

    // 5. Degenerate chain
    IncomeProcess one = IncomeProcessFactory::make_tauchen_hussey(1, 0.9, 0.1);
    assert(one.n_z == 1 && one.Pi_flat[0] == 1.0 && one.z_grid[0] == 1.0);

    // 6. Row underflow: nodes at +/-10 with sigma 0.1
    bool thrown = false;
    try {
        IncomeProcessFactory::make_tauchen_hussey(2, 0.0, 0.1, 0.0, 100.0);
    } catch (const DiscretizationError& e) {
        thrown = true;
        std::cout << "Caught: " << e.what() << std::endl;
    }
    assert(thrown);

    // 7. Persistent shock on a wide node set: off-diagonal mass underflows, chain splits
    thrown = false;
    try {
        IncomeProcessFactory::make_tauchen_hussey(3, 0.95, std::sqrt(0.015), 0.0, 3.0);
    } catch (const DiscretizationError& e) {
        thrown = true;
        std::cout << "Caught: " << e.what() << std::endl;
    }
    assert(thrown);

    // Two closed classes: repeated unit eigenvalue
    std::vector<double> split = {0.9, 0.1, 0.0, 0.0,
                                 0.2, 0.8, 0.0, 0.0,
                                 0.0, 0.0, 0.5, 0.5,
                                 0.0, 0.0, 0.3, 0.7};
    thrown = false;
    try { IncomeProcessFactory::stationary_distribution(split, 4); } catch (const DiscretizationError&) { thrown = true; }
    assert(thrown);

    // 8. Invalid parameters
    thrown = false;
    try { IncomeProcessFactory::make_tauchen_hussey(3, 1.0, 0.1); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);
    thrown = false;
    try { IncomeProcessFactory::make_tauchen_hussey(3, 0.5, 0.0); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);
    thrown = false;
    try { IncomeProcessFactory::make_tauchen_hussey(0, 0.5, 0.1); } catch (const ConfigurationError&) { thrown = true; }
    assert(thrown);

    std::cout << "SUCCESS: income process verified." << std::endl;
    return 0;
}
