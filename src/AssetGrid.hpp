#pragma once
#include <algorithm>
#include <utility>
#include <vector>

// Ordered asset holdings, nodes[0] is the grid floor (loosest borrowing limit)
struct AssetGrid {
    std::vector<double> nodes;
    int size;

    explicit AssetGrid(const std::vector<double>& n) : nodes(n), size(static_cast<int>(n.size())) {}
    AssetGrid() : size(0) {}

    double min() const { return nodes.front(); }
    double max() const { return nodes.back(); }
    double operator[](int i) const { return nodes[i]; }

    // First index whose node is not below `value` (tolerance eps).
    // Returns size when value lies above the top node.
    int index_at_or_above(double value, double eps = 1e-10) const {
        auto it = std::lower_bound(nodes.begin(), nodes.end(), value - eps);
        return static_cast<int>(std::distance(nodes.begin(), it));
    }
};

struct StateSpace {
    int n_a;
    int n_z;
    int size;

    StateSpace(int na, int nz) : n_a(na), n_z(nz), size(na*nz) {}

    // Global Index: z * Na + a (column-major (a, z) matrix)
    int idx(int ia, int iz) const { return iz * n_a + ia; }

    // Reverse
    std::pair<int, int> get_coords(int k) const {
        return {k % n_a, k / n_a};
    }
};
