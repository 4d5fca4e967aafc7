#pragma once

#include <scribe/result.hpp>
#include <scribe/log.hpp>
#include <scribe/core/quality_gate.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

struct StorageConfig {
    std::string path;  // empty means ~/.scribe/scribe.db
};

struct DiffConfig {
    size_t max_lines = 50000;
    int context_lines = 3;
};

struct BenchmarkConfig {
    double gate_threshold = 70.0;
    std::map<std::string, double> weights;
};

// Layered configuration: global < project (project wins)
struct Config {
    StorageConfig storage;
    DiffConfig diff;
    BenchmarkConfig benchmark;
    log::Level log_level = log::Info;
    bool log_timestamps = false;
    // Ordered quality gate rules per deployment environment
    std::map<std::string, std::vector<QualityGateRule>> gates;

    // Track which scalar fields were explicitly set (for merge)
    bool storage_path_set = false;
    bool diff_max_lines_set = false;
    bool diff_context_lines_set = false;
    bool gate_threshold_set = false;
    bool log_level_set = false;
    bool log_timestamps_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this). An
    // environment's rule list is replaced as a whole.
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Rules for one environment; Config error when none are configured
    Result<std::vector<QualityGateRule>> rules_for(const std::string& environment) const;

    // storage.path with '~/' expanded, or the default database location
    std::string resolved_storage_path() const;

    // Push the [log] settings into the global logger
    void apply_logging() const;
};

// ~/.scribe (or $SCRIBE_HOME when set)
std::string scribe_home();

// Discover the global config file path: ~/.scribe/config.toml
std::string global_config_path();

} // namespace scribe
