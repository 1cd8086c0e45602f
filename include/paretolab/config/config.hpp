#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <toml.hpp>

namespace paretolab::operators {
struct SelectionConfig; // Forward declaration
}

namespace paretolab::config {

/// Custom exception for configuration validation errors
class ConfigValidationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Non-dominated sorting configuration
struct SortingConfig {
    std::string algorithm = "fast"; // "fast" (divide and conquer) or "naive"
    bool constraint_aware = false;
};

/// Environmental selection configuration
struct SurvivalConfig {
    std::string strategy = "nsga3";     // "nsga3" or "nsga2"
    std::size_t population_size = 100; // Survivors per generation
};

/// Reference direction lattice; the inner layer is optional
struct ReferencePointsConfig {
    std::size_t divisions = 12;
    std::optional<double> scaling;
    std::optional<std::size_t> inner_divisions;
    std::optional<double> inner_scaling;
};

/// Niching configuration
struct NichingConfig {
    std::uint64_t seed = 1;                    // Reproducible seed by default
    std::string niche_count_policy = "reset"; // "reset" or "carry"
    bool track_normalization = true;          // Remember ideal, worst and extreme points
};

/// Parallel association configuration
struct ParallelConfig {
    bool enabled = false;        // Sequential by default
    std::size_t grain_size = 64; // Smallest chunk of rows per task
};

/// Selection history configuration
struct LoggingConfig {
    bool verbose = false;
    std::size_t history_limit = 100; // 0 keeps no history
};

/// Command-line override structure
/// Contains optional overrides for configuration parameters
struct ConfigOverrides {
    std::optional<std::size_t> population_size;
    std::optional<std::size_t> divisions;
    std::optional<std::string> algorithm;
    std::optional<std::string> strategy;
    std::optional<bool> constraint_aware;
    std::optional<std::uint64_t> seed;
};

/// Complete configuration structure
struct Config {
    SortingConfig sorting;
    SurvivalConfig survival;
    ReferencePointsConfig reference_points;
    NichingConfig niching;
    ParallelConfig parallel;
    LoggingConfig logging;

    /// Load configuration from TOML file
    /// Validates all parameters and applies defaults for missing values
    static Config from_file(const std::string& filepath);

    /// Load configuration from TOML string
    static Config from_string(const std::string& toml_string);

    /// Validate configuration parameters
    /// Throws ConfigValidationError if any parameter is invalid
    void validate() const;

    /// Export configuration to TOML string
    std::string to_toml() const;

    /// Convert to operators::SelectionConfig for the survival factories
    operators::SelectionConfig to_selection_config() const;

    /// Apply command-line overrides to configuration
    /// Overrides take precedence over loaded values
    void apply_overrides(const ConfigOverrides& overrides);

  private:
    static Config from_toml(const toml::value& data);

    static SortingConfig parse_sorting(const toml::value& data);
    static SurvivalConfig parse_survival(const toml::value& data);
    static ReferencePointsConfig parse_reference_points(const toml::value& data);
    static NichingConfig parse_niching(const toml::value& data);
    static ParallelConfig parse_parallel(const toml::value& data);
    static LoggingConfig parse_logging(const toml::value& data);

    /// Read a floating-point key that may be written as an integer
    static double find_number(const toml::value& table, const std::string& key);
};

// Implementation of Config methods

inline Config Config::from_file(const std::string& filepath) {
    const auto data = toml::parse(filepath);
    return from_toml(data);
}

inline Config Config::from_string(const std::string& toml_string) {
    std::istringstream iss(toml_string);
    const auto data = toml::parse(iss, "config_string");
    return from_toml(data);
}

inline Config Config::from_toml(const toml::value& data) {
    Config config;

    // Parse each section if it exists, otherwise use defaults
    if (data.contains("sorting")) {
        config.sorting = parse_sorting(data);
    }

    if (data.contains("survival")) {
        config.survival = parse_survival(data);
    }

    if (data.contains("reference_points")) {
        config.reference_points = parse_reference_points(data);
    }

    if (data.contains("niching")) {
        config.niching = parse_niching(data);
    }

    if (data.contains("parallel")) {
        config.parallel = parse_parallel(data);
    }

    if (data.contains("logging")) {
        config.logging = parse_logging(data);
    }

    // Validate the complete configuration
    config.validate();
    return config;
}

inline void Config::validate() const {
    if (sorting.algorithm != "fast" && sorting.algorithm != "naive") {
        throw ConfigValidationError("Unknown sorting algorithm '" + sorting.algorithm +
                                    "' (expected 'fast' or 'naive')");
    }

    if (survival.strategy != "nsga3" && survival.strategy != "nsga2") {
        throw ConfigValidationError("Unknown survival strategy '" + survival.strategy +
                                    "' (expected 'nsga3' or 'nsga2')");
    }

    if (survival.population_size == 0) {
        throw ConfigValidationError("Population size must be positive");
    }

    // Reference point lattice
    if (reference_points.divisions == 0) {
        throw ConfigValidationError("Reference point divisions must be positive");
    }

    auto valid_scaling = [](const std::optional<double>& scaling) {
        return !scaling || (std::isfinite(*scaling) && *scaling > 0.0);
    };

    if (!valid_scaling(reference_points.scaling)) {
        throw ConfigValidationError("Reference point scaling must be finite and positive");
    }

    if (reference_points.inner_divisions && *reference_points.inner_divisions == 0) {
        throw ConfigValidationError("Inner reference point divisions must be positive");
    }

    if (!valid_scaling(reference_points.inner_scaling)) {
        throw ConfigValidationError("Inner reference point scaling must be finite and positive");
    }

    if (reference_points.inner_scaling && !reference_points.inner_divisions) {
        throw ConfigValidationError("Inner reference point scaling requires inner_divisions");
    }

    if (niching.niche_count_policy != "reset" && niching.niche_count_policy != "carry") {
        throw ConfigValidationError("Unknown niche count policy '" + niching.niche_count_policy +
                                    "' (expected 'reset' or 'carry')");
    }

    if (parallel.grain_size == 0) {
        throw ConfigValidationError("Parallel grain size must be positive");
    }
}

inline double Config::find_number(const toml::value& table, const std::string& key) {
    // Handle both integer and floating-point values
    const auto& value = table.at(key);
    if (value.is_integer()) {
        return static_cast<double>(toml::find<std::int64_t>(table, key));
    }
    return toml::find<double>(table, key);
}

inline SortingConfig Config::parse_sorting(const toml::value& data) {
    SortingConfig sorting;
    const auto& sorting_table = toml::find(data, "sorting");

    if (sorting_table.contains("algorithm")) {
        sorting.algorithm = toml::find<std::string>(sorting_table, "algorithm");
    }

    if (sorting_table.contains("constraint_aware")) {
        sorting.constraint_aware = toml::find<bool>(sorting_table, "constraint_aware");
    }

    return sorting;
}

inline SurvivalConfig Config::parse_survival(const toml::value& data) {
    SurvivalConfig survival;
    const auto& survival_table = toml::find(data, "survival");

    if (survival_table.contains("strategy")) {
        survival.strategy = toml::find<std::string>(survival_table, "strategy");
    }

    if (survival_table.contains("population_size")) {
        survival.population_size = toml::find<std::size_t>(survival_table, "population_size");
    }

    return survival;
}

inline ReferencePointsConfig Config::parse_reference_points(const toml::value& data) {
    ReferencePointsConfig refs;
    const auto& refs_table = toml::find(data, "reference_points");

    if (refs_table.contains("divisions")) {
        refs.divisions = toml::find<std::size_t>(refs_table, "divisions");
    }

    if (refs_table.contains("scaling")) {
        refs.scaling = find_number(refs_table, "scaling");
    }

    if (refs_table.contains("inner_divisions")) {
        refs.inner_divisions = toml::find<std::size_t>(refs_table, "inner_divisions");
    }

    if (refs_table.contains("inner_scaling")) {
        refs.inner_scaling = find_number(refs_table, "inner_scaling");
    }

    return refs;
}

inline NichingConfig Config::parse_niching(const toml::value& data) {
    NichingConfig niching;
    const auto& niching_table = toml::find(data, "niching");

    if (niching_table.contains("seed")) {
        niching.seed = toml::find<std::uint64_t>(niching_table, "seed");
    }

    if (niching_table.contains("niche_count_policy")) {
        niching.niche_count_policy = toml::find<std::string>(niching_table, "niche_count_policy");
    }

    if (niching_table.contains("track_normalization")) {
        niching.track_normalization = toml::find<bool>(niching_table, "track_normalization");
    }

    return niching;
}

inline ParallelConfig Config::parse_parallel(const toml::value& data) {
    ParallelConfig par;
    const auto& par_table = toml::find(data, "parallel");

    if (par_table.contains("enabled")) {
        par.enabled = toml::find<bool>(par_table, "enabled");
    }

    if (par_table.contains("grain_size")) {
        par.grain_size = toml::find<std::size_t>(par_table, "grain_size");
    }

    return par;
}

inline LoggingConfig Config::parse_logging(const toml::value& data) {
    LoggingConfig log;
    const auto& log_table = toml::find(data, "logging");

    if (log_table.contains("verbose")) {
        log.verbose = toml::find<bool>(log_table, "verbose");
    }

    if (log_table.contains("history_limit")) {
        log.history_limit = toml::find<std::size_t>(log_table, "history_limit");
    }

    return log;
}

inline std::string Config::to_toml() const {
    toml::value root;

    // Sorting section
    toml::value sorting_table;
    sorting_table["algorithm"] = sorting.algorithm;
    sorting_table["constraint_aware"] = sorting.constraint_aware;
    root["sorting"] = sorting_table;

    // Survival section
    toml::value survival_table;
    survival_table["strategy"] = survival.strategy;
    survival_table["population_size"] = survival.population_size;
    root["survival"] = survival_table;

    // Reference points section; optional keys only when set
    toml::value refs_table;
    refs_table["divisions"] = reference_points.divisions;
    if (reference_points.scaling) {
        refs_table["scaling"] = *reference_points.scaling;
    }
    if (reference_points.inner_divisions) {
        refs_table["inner_divisions"] = *reference_points.inner_divisions;
    }
    if (reference_points.inner_scaling) {
        refs_table["inner_scaling"] = *reference_points.inner_scaling;
    }
    root["reference_points"] = refs_table;

    // Niching section
    toml::value niching_table;
    niching_table["seed"] = niching.seed;
    niching_table["niche_count_policy"] = niching.niche_count_policy;
    niching_table["track_normalization"] = niching.track_normalization;
    root["niching"] = niching_table;

    // Parallel section
    toml::value par_table;
    par_table["enabled"] = parallel.enabled;
    par_table["grain_size"] = parallel.grain_size;
    root["parallel"] = par_table;

    // Logging section
    toml::value log_table;
    log_table["verbose"] = logging.verbose;
    log_table["history_limit"] = logging.history_limit;
    root["logging"] = log_table;

    std::stringstream ss;
    ss << toml::format(root);
    return ss.str();
}

inline void Config::apply_overrides(const ConfigOverrides& overrides) {
    // Apply overrides only if they are set
    if (overrides.population_size.has_value()) {
        survival.population_size = overrides.population_size.value();
    }

    if (overrides.divisions.has_value()) {
        reference_points.divisions = overrides.divisions.value();
    }

    if (overrides.algorithm.has_value()) {
        sorting.algorithm = overrides.algorithm.value();
    }

    if (overrides.strategy.has_value()) {
        survival.strategy = overrides.strategy.value();
    }

    if (overrides.constraint_aware.has_value()) {
        sorting.constraint_aware = overrides.constraint_aware.value();
    }

    if (overrides.seed.has_value()) {
        niching.seed = overrides.seed.value();
    }

    // Re-validate after applying overrides
    validate();
}

} // namespace paretolab::config

// Implementation that depends on operators::SelectionConfig
// Must be after namespace closing to access paretolab::operators
#include <paretolab/operators/survival.hpp>

namespace paretolab::config {

inline operators::SelectionConfig Config::to_selection_config() const {
    operators::SelectionConfig selection;

    selection.sort.algorithm = paretolab::sorting::parse_sort_algorithm(sorting.algorithm);
    selection.sort.constraint_aware = sorting.constraint_aware;

    selection.strategy = survival.strategy == "nsga2" ? operators::SurvivalStrategy::nsga2
                                                      : operators::SurvivalStrategy::nsga3;
    selection.population_size = survival.population_size;

    // Boundary layer, then the optional inner layer (scaled to 0.5 unless given)
    selection.reference_layers.clear();
    selection.reference_layers.push_back(
        {reference_points.divisions, reference_points.scaling.value_or(1.0)});
    if (reference_points.inner_divisions) {
        selection.reference_layers.push_back(
            {*reference_points.inner_divisions, reference_points.inner_scaling.value_or(0.5)});
    }

    selection.seed = niching.seed;
    selection.niche_count_policy = niching.niche_count_policy == "carry"
                                       ? operators::NicheCountPolicy::carry
                                       : operators::NicheCountPolicy::reset;
    selection.track_normalization = niching.track_normalization;

    selection.parallel = parallel.enabled;
    selection.grain_size = parallel.grain_size;

    selection.history_limit = logging.history_limit;

    return selection;
}

} // namespace paretolab::config
