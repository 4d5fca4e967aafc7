#include <scribe/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace scribe {

static ScribeError bad_type(const std::string& where, const char* expected) {
    return ScribeError{ScribeError::Config,
        "config key '" + where + "' must be " + expected};
}

// Optional numeric key; present but non-numeric is an error
static Result<std::optional<double>> read_number(const toml::table& tbl,
                                                 const char* key,
                                                 const std::string& where) {
    const toml::node* n = tbl.get(key);
    if (!n) return Result<std::optional<double>>::ok(std::nullopt);
    auto v = n->value<double>();
    if (!v) return bad_type(where + "." + key, "a number");
    return Result<std::optional<double>>::ok(*v);
}

static Result<QualityGateRule> parse_rule(const toml::table& tbl,
                                          const std::string& env, size_t index) {
    std::string where = "gates." + env + "[" + std::to_string(index) + "]";

    RuleDefinition def;
    if (const toml::node* n = tbl.get("id")) {
        auto v = n->value<std::string>();
        if (!v) return bad_type(where + ".id", "a string");
        def.id = *v;
    } else {
        return ScribeError{ScribeError::Config, where + " is missing 'id'"};
    }
    if (const toml::node* n = tbl.get("name")) {
        auto v = n->value<std::string>();
        if (!v) return bad_type(where + ".name", "a string");
        def.name = *v;
    }
    if (const toml::node* n = tbl.get("kind")) {
        auto v = n->value<std::string>();
        if (!v) return bad_type(where + ".kind", "a string");
        def.kind = *v;
    } else {
        return ScribeError{ScribeError::Config, where + " is missing 'kind'"};
    }
    if (const toml::node* n = tbl.get("blocking")) {
        auto v = n->value<bool>();
        if (!v) return bad_type(where + ".blocking", "a boolean");
        def.blocking = *v;
    }
    if (const toml::node* n = tbl.get("dimension")) {
        auto v = n->value<std::string>();
        if (!v) return bad_type(where + ".dimension", "a string");
        def.params.dimension = *v;
    }

    auto threshold = read_number(tbl, "threshold", where);
    if (threshold.is_err()) return std::move(threshold).error();
    def.params.threshold = threshold.value();

    auto tolerance = read_number(tbl, "tolerance", where);
    if (tolerance.is_err()) return std::move(tolerance).error();
    def.params.tolerance = tolerance.value();

    auto max_age = read_number(tbl, "max_age_hours", where);
    if (max_age.is_err()) return std::move(max_age).error();
    def.params.max_age_hours = max_age.value();

    return QualityGateRule::make(def.id, def.name, def.kind, def.params, def.blocking);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ScribeError{ScribeError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [storage] section
    if (auto storage = doc["storage"].as_table()) {
        if (const toml::node* n = storage->get("path")) {
            auto v = n->value<std::string>();
            if (!v) return bad_type("storage.path", "a string");
            cfg.storage.path = *v;
            cfg.storage_path_set = true;
        }
    }

    // [diff] section
    if (auto diff = doc["diff"].as_table()) {
        if (const toml::node* n = diff->get("max_lines")) {
            auto v = n->value<int64_t>();
            if (!v || *v <= 0) return bad_type("diff.max_lines", "a positive integer");
            cfg.diff.max_lines = static_cast<size_t>(*v);
            cfg.diff_max_lines_set = true;
        }
        if (const toml::node* n = diff->get("context_lines")) {
            auto v = n->value<int64_t>();
            if (!v || *v < 0) return bad_type("diff.context_lines", "a non-negative integer");
            cfg.diff.context_lines = static_cast<int>(*v);
            cfg.diff_context_lines_set = true;
        }
    }

    // [benchmark] section
    if (auto bench = doc["benchmark"].as_table()) {
        auto threshold = read_number(*bench, "gate_threshold", "benchmark");
        if (threshold.is_err()) return std::move(threshold).error();
        if (threshold.value().has_value()) {
            cfg.benchmark.gate_threshold = *threshold.value();
            cfg.gate_threshold_set = true;
        }
        if (const toml::node* n = bench->get("weights")) {
            auto weights = n->as_table();
            if (!weights) return bad_type("benchmark.weights", "a table");
            for (const auto& [key, val] : *weights) {
                std::string k(key);
                auto w = val.value<double>();
                if (!w || *w < 0.0) {
                    return bad_type("benchmark.weights." + k, "a non-negative number");
                }
                cfg.benchmark.weights[k] = *w;
            }
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (const toml::node* n = lg->get("level")) {
            auto v = n->value<std::string>();
            if (!v) return bad_type("log.level", "a string");
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (const toml::node* n = lg->get("timestamps")) {
            auto v = n->value<bool>();
            if (!v) return bad_type("log.timestamps", "a boolean");
            cfg.log_timestamps = *v;
            cfg.log_timestamps_set = true;
        }
    }

    // [[gates.<environment>]] rule lists
    if (auto gates = doc["gates"].as_table()) {
        for (const auto& [key, val] : *gates) {
            std::string env(key);
            auto arr = val.as_array();
            if (!arr) return bad_type("gates." + env, "an array of tables");

            std::vector<QualityGateRule> rules;
            for (size_t i = 0; i < arr->size(); ++i) {
                auto tbl = arr->get(i)->as_table();
                if (!tbl) return bad_type("gates." + env, "an array of tables");

                bool enabled = true;
                if (const toml::node* n = tbl->get("enabled")) {
                    auto v = n->value<bool>();
                    if (!v) {
                        return bad_type("gates." + env + "[" + std::to_string(i) + "].enabled",
                                        "a boolean");
                    }
                    enabled = *v;
                }

                auto rule = parse_rule(*tbl, env, i);
                if (rule.is_err()) return std::move(rule).error();
                if (enabled) rules.push_back(std::move(rule).value());
            }
            cfg.gates[env] = std::move(rules);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ScribeError{ScribeError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().message = path + ": " + cfg.error().message;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.storage_path_set) {
        storage.path = other.storage.path;
        storage_path_set = true;
    }
    if (other.diff_max_lines_set) {
        diff.max_lines = other.diff.max_lines;
        diff_max_lines_set = true;
    }
    if (other.diff_context_lines_set) {
        diff.context_lines = other.diff.context_lines;
        diff_context_lines_set = true;
    }
    if (other.gate_threshold_set) {
        benchmark.gate_threshold = other.benchmark.gate_threshold;
        gate_threshold_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_timestamps_set) {
        log_timestamps = other.log_timestamps;
        log_timestamps_set = true;
    }

    // Weights: other overrides this per-dimension
    for (const auto& [k, v] : other.benchmark.weights) {
        benchmark.weights[k] = v;
    }

    // Gates: other replaces whole environments
    for (const auto& [env, rules] : other.gates) {
        gates[env] = rules;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

Result<std::vector<QualityGateRule>> Config::rules_for(const std::string& environment) const {
    auto it = gates.find(environment);
    if (it == gates.end()) {
        return ScribeError{ScribeError::Config,
            "no quality gates configured for environment '" + environment + "'",
            "add [[gates." + environment + "]] tables to the config"};
    }
    return Result<std::vector<QualityGateRule>>::ok(it->second);
}

std::string Config::resolved_storage_path() const {
    if (storage.path.empty()) return scribe_home() + "/scribe.db";
    if (storage.path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + storage.path.substr(1);
    }
    return storage.path;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    log::set_timestamps_enabled(log_timestamps);
}

std::string scribe_home() {
    if (const char* override_dir = std::getenv("SCRIBE_HOME")) {
        return override_dir;
    }
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.scribe";
}

std::string global_config_path() {
    return scribe_home() + "/config.toml";
}

} // namespace scribe
