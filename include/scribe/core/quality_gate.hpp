#pragma once

#include <scribe/result.hpp>
#include <scribe/core/model.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scribe {

// Rule parameters, one struct per rule kind
struct MinimumScore {
    double threshold = 0.0;
};

struct DimensionFloor {
    std::string dimension;
    double threshold = 0.0;
};

struct NoRegression {
    double tolerance = 0.0;
};

struct BenchmarkFreshness {
    double max_age_hours = 24.0;
};

using RuleParams = std::variant<MinimumScore, DimensionFloor, NoRegression, BenchmarkFreshness>;

// Untyped parameters as they arrive from configuration
struct RuleParameters {
    std::optional<double> threshold;
    std::optional<std::string> dimension;
    std::optional<double> tolerance;
    std::optional<double> max_age_hours;
};

struct QualityGateRule {
    std::string id;
    std::string name;
    RuleParams params;
    bool blocking = true;

    // "minimum_score", "dimension_floor", "no_regression", "benchmark_freshness"
    const char* kind() const;

    // Build a rule from its kind name. Unknown kinds fail with
    // UnsupportedRule, missing or out-of-range parameters with Config.
    static Result<QualityGateRule> make(const std::string& id,
                                        const std::string& name,
                                        const std::string& kind,
                                        const RuleParameters& params,
                                        bool blocking);
};

// Rule as written in configuration, before its kind is checked
struct RuleDefinition {
    std::string id;
    std::string name;
    std::string kind;
    RuleParameters params;
    bool blocking = true;
};

enum class GateStatus {
    Passed,
    Failed,
    Warning,
};

const char* gate_status_name(GateStatus s);

struct GateEvaluation {
    std::string rule_id;
    std::string rule_name;
    GateStatus status = GateStatus::Passed;
    std::string message;
    bool blocking = true;
};

struct GateVerdict {
    bool can_deploy = false;
    std::vector<GateEvaluation> evaluations;  // one per rule, in rule order
    std::vector<std::string> blockers;        // messages of failed evaluations
    std::vector<std::string> warnings;        // messages of warning evaluations
    std::string summary;
};

// Apply every rule to `latest`. `history` is newest first and may contain
// `latest` itself. A failed condition is Failed when the rule is blocking,
// Warning otherwise; the verdict allows deployment iff nothing Failed.
GateVerdict evaluate(const std::vector<QualityGateRule>& rules,
                     const BenchmarkResult& latest,
                     const std::vector<BenchmarkResult>& history,
                     int64_t now_ms);

// Same, from unchecked definitions. Any unknown kind fails the whole
// evaluation with UnsupportedRule and no verdict is produced.
Result<GateVerdict> evaluate(const std::vector<RuleDefinition>& rules,
                             const BenchmarkResult& latest,
                             const std::vector<BenchmarkResult>& history,
                             int64_t now_ms);

} // namespace scribe
