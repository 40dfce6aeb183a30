#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include "Params.hpp"
#include "Progress.hpp"
#include "io/json_loader.hpp"
#include "bewley/engine.h"

// CSV writers
void write_csv_ss(const std::string& filename, const Bewley::SteadyStateResult& ss) {
    std::ofstream f(filename);
    if (!f) throw std::runtime_error("Could not write " + filename);

    const auto& hh = ss.equilibrium.household;
    const auto& D = ss.equilibrium.distribution.D;
    f << "asset,z_idx,income,value,consumption,next_asset,distribution\n";
    int na = ss.n_a;

    // policies and D are flattened (nz * na)
    for(int j=0; j<ss.n_z; ++j) {
        for(int i=0; i<na; ++i) {
            int idx = j * na + i;
            f << ss.asset_grid[i] << "," << j << "," << ss.income_levels[j] << ","
              << hh.value[idx] << "," << hh.c_pol[idx] << "," << hh.a_pol[idx] << "," << D[idx] << "\n";
        }
    }
    std::cout << "[Bewley::IO] Wrote " << filename << std::endl;
}

void write_csv_trans(const std::string& filename, const Bewley::TransitionResult& path) {
    std::ofstream f(filename);
    if (!f) throw std::runtime_error("Could not write " + filename);

    f << "period,limit,r,w,assets,supply,excess\n";
    for(int t=0; t<path.periods; ++t) {
        f << t << "," << path.limits[t] << "," << path.r[t] << "," << path.w[t] << ","
          << path.assets[t] << "," << path.supply[t] << "," << path.excess[t] << "\n";
    }
    std::cout << "[Bewley::IO] Wrote " << filename << std::endl;
}

void print_summary(const std::string& label, const Bewley::SteadyStateResult& ss) {
    const auto& eq = ss.equilibrium;
    const auto& st = ss.stats;
    std::cout << "  [" << label << "] limit = " << ss.borrowing_limit
              << " | status = " << Bewley::to_string(eq.report.status)
              << " (" << eq.report.iterations << " iters)" << std::endl;
    std::cout << "  -> Equilibrium r = " << eq.r << " (" << eq.r * 100.0 << "%), w = " << eq.w << std::endl;
    std::cout << "  -> Demand = " << eq.demand << ", Supply = " << eq.supply
              << ", Excess = " << eq.excess << std::endl;
    std::cout << "  -> Bracket [" << eq.r_low << ", " << eq.r_high << "]" << std::endl;
    std::cout << "  -> C = " << st.aggregate_consumption << " | Constrained = " << st.constrained_share
              << " | Gini = " << st.gini << " | Top10 = " << st.top10_share << std::endl;
    if (eq.inner_failures > 0) {
        std::cout << "  [WARN] " << eq.inner_failures << " candidate(s) had unconverged inner solves" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    try {
        // 1. Setup & Load Config
        std::string config_path = (argc > 1) ? argv[1] : "model.json";
        std::cout << "=== Bewley Engine ===" << std::endl;
        std::cout << "Config: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Error: Config file not found: " << config_path << std::endl;
            return 1;
        }

        BewleyParams params;
        JsonLoader::load_model(config_path, params);

        bool verbose = params.get("verbose", 0.0) != 0.0;
        Bewley::ConsoleProgressSink console(std::cout, verbose);
        Bewley::BewleyEngine engine(params, &console);

        std::cout << "[Bewley::Income] Nz = " << engine.income().n_z
                  << ", mean income = " << engine.income().mean_income() << std::endl;

        // 2. Stationary equilibrium, or both ends of the path
        const auto& tc = engine.config().transition;
        if (tc.periods == 0) {
            std::cout << "\n--- Step 1: Solving Steady State ---" << std::endl;
            auto ss = engine.solve_steady_state();
            print_summary("SS", ss);
            write_csv_ss("steady_state.csv", ss);
        } else {
            std::cout << "\n--- Step 1: Solving Initial & Terminal Steady States ---" << std::endl;
            auto run = engine.solve_transition();
            print_summary("Initial", run.initial);
            print_summary("Terminal", run.terminal);
            write_csv_ss("steady_state_initial.csv", run.initial);
            write_csv_ss("steady_state.csv", run.terminal);

            std::cout << "\n--- Step 2: Transition Path (T = " << tc.periods << ") ---" << std::endl;
            std::cout << "  -> status = " << Bewley::to_string(run.path.report.status)
                      << " after " << run.path.report.iterations << " iters, max |ED| = "
                      << run.path.report.residual << ", terminal gap = " << run.path.terminal_gap << std::endl;
            write_csv_trans("transition.csv", run.path);
        }

        std::cout << "\n=== Finished Successfully ===" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
