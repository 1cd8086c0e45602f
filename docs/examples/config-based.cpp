/**
 * @file config-based.cpp
 * @brief Configuration-driven survival selection using TOML files
 *
 * This example shows how a TOML file picks the sorting algorithm, the survival strategy and
 * the reference directions without recompiling, and how a selection run is reported as JSON.
 *
 * Build with the top-level CMake project:
 *   cmake --build build --target paretolab_example_config_based
 *
 * Run with:
 *   ./config-based config/default.toml
 */

#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <variant>

#include <paretolab/paretolab.hpp>

using namespace paretolab;

// Create a sample TOML configuration file
void create_sample_config(const std::string& filename) {
    std::ofstream config_file(filename);
    if (!config_file) {
        throw std::runtime_error("Cannot create config file: " + filename);
    }

    config_file << R"(
# ParetoLab survival selection configuration

[sorting]
algorithm = "fast"        # "fast" (divide and conquer) or "naive"
constraint_aware = true

[survival]
strategy = "nsga3"        # "nsga3" or "nsga2"
population_size = 60

[reference_points]
divisions = 3
inner_divisions = 2       # Optional inner layer, scaled by 0.5

[niching]
seed = 42
niche_count_policy = "reset"

[logging]
verbose = true
history_limit = 10
)";

    std::cout << "Created sample configuration file: " << filename << "\n";
}

void print_config_summary(const config::Config& cfg) {
    std::cout << "Configuration Summary:\n";
    std::cout << "=====================\n";
    std::cout << "Sorting:            " << cfg.sorting.algorithm
              << (cfg.sorting.constraint_aware ? " (constraint-aware)" : "") << "\n";
    std::cout << "Strategy:           " << cfg.survival.strategy << "\n";
    std::cout << "Population size:    " << cfg.survival.population_size << "\n";
    std::cout << "Divisions:          " << cfg.reference_points.divisions;
    if (cfg.reference_points.inner_divisions) {
        std::cout << " + " << *cfg.reference_points.inner_divisions << " inner";
    }
    std::cout << "\n";
    std::cout << "Random seed:        " << cfg.niching.seed << "\n";
    std::cout << "Verbose logging:    " << (cfg.logging.verbose ? "Yes" : "No") << "\n\n";
}

/// Five-objective records with a single constraint violated by a quarter of them
std::vector<core::FitnessRecord> sample_fitnesses(std::size_t n, std::mt19937& rng) {
    std::uniform_real_distribution<double> value(0.0, 1.0);
    std::vector<core::FitnessRecord> fitnesses;
    fitnesses.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        std::vector<double> objectives(5);
        for (auto& v : objectives) {
            v = value(rng);
        }
        const double violation = i % 4 == 0 ? value(rng) : 0.0;
        fitnesses.emplace_back(std::move(objectives), std::vector<double>{violation});
    }
    return fitnesses;
}

int main(int argc, char** argv) {
    std::cout << "ParetoLab Configuration-Based Example\n";
    std::cout << "=====================================\n\n";

    std::string config_filename;

    if (argc < 2) {
        // No config file provided, create a sample one
        config_filename = "example-config.toml";
        std::cout << "No configuration file provided. Creating sample config...\n\n";
        try {
            create_sample_config(config_filename);
        } catch (const std::exception& e) {
            std::cerr << "Error creating config file: " << e.what() << "\n";
            return 1;
        }
    } else {
        config_filename = argv[1];
    }

    std::cout << "Loading configuration from: " << config_filename << "\n\n";

    config::Config cfg;
    try {
        cfg = config::Config::from_file(config_filename);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << "\n";
        return 1;
    }

    print_config_summary(cfg);

    auto survival = factory::make_survival_from_config(cfg);
    std::mt19937 rng(cfg.niching.seed);

    const std::size_t k = cfg.survival.population_size;
    const auto fitnesses = sample_fitnesses(2 * k, rng);

    operators::SelectionResult result;
    std::visit(
        [&](auto& selector) {
            for (int call = 0; call < 3; ++call) {
                result = selector.select(fitnesses, k, rng);
            }
            if (cfg.logging.verbose) {
                std::cout << io::selection_report(cfg, result, selector.history()).dump(2)
                          << "\n";
            }
        },
        survival);

    std::cout << "\nSelected " << result.stats.selected << " of "
              << result.stats.population_size << " individuals from "
              << result.stats.front_count << " fronts\n";

    return 0;
}
