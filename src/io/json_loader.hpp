#pragma once
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <stdexcept>
#include "../Params.hpp"

class JsonLoader {
public:
    using json = nlohmann::json;

    static void load_model(const std::string& filepath, BewleyParams& params) {
        std::ifstream f(filepath);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open model file: " + filepath);
        }

        json data;
        try {
            data = json::parse(f);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Malformed model file " + filepath + ": " + e.what());
        }
        load_model(data, params);
    }

    static void load_model(const json& data, BewleyParams& params) {
        std::cout << "[Bewley::IO] Loading model: " << data.value("model_name", "Unknown") << std::endl;

        // 1. Free-form parameters
        read_numbers(data, "parameters", params);

        // 2. Grid Definition
        if (data.contains("grid")) {
            const auto& g = data["grid"];
            params.grid_kind = grid_kind(g.value("type", "Uniform"));
            copy_number(g, "n_points", "n_a", params);
            copy_number(g, "min", "a_min", params);
            copy_number(g, "max", "a_max", params);
            copy_number(g, "curvature", "curvature", params);
            std::cout << "[Bewley::IO] Asset grid: " << params.grid_kind
                      << " (n=" << params.get("n_a", 0.0) << ")" << std::endl;
        }

        // 3. Income Process
        if (data.contains("income_process")) {
            read_numbers(data, "income_process", params);
            std::cout << "[Bewley::IO] Income process: Tauchen-Hussey (Nz=" << params.get("n_z", 0.0) << ")" << std::endl;
        }

        // 4. Market
        if (data.contains("market")) {
            const auto& m = data["market"];
            params.market = m.value("type", "Huggett");
            read_numbers(data, "market", params);
            std::cout << "[Bewley::IO] Market: " << params.market << std::endl;
        }

        // 5. Solver tolerances, 6. Transition
        read_numbers(data, "solver", params);
        read_numbers(data, "transition", params);
    }

private:
    static std::string grid_kind(const std::string& type) {
        if (type == "Uniform" || type == "uniform") return "uniform";
        if (type == "Log-spaced" || type == "log_spaced") return "log_spaced";
        if (type == "Power" || type == "power") return "power";
        return type; // rejected by ModelConfig
    }

    static void read_numbers(const json& data, const std::string& section, BewleyParams& params) {
        if (!data.contains(section)) return;
        const auto& obj = data[section];
        if (!obj.is_object()) {
            throw std::runtime_error("Section '" + section + "' must be an object");
        }
        for (auto& [key, val] : obj.items()) {
            if (val.is_boolean()) {
                params.scalars[key] = val.get<bool>() ? 1.0 : 0.0;
            } else if (val.is_number()) {
                params.scalars[key] = val.get<double>();
            }
        }
    }

    static void copy_number(const json& obj, const std::string& from, const std::string& to, BewleyParams& params) {
        if (obj.contains(from) && obj[from].is_number()) {
            params.scalars[to] = obj[from].get<double>();
        }
    }
};
