#include <scribe/core/quality_gate.hpp>
#include <cstdarg>
#include <cstdio>

namespace scribe {

static std::string format_msg(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list sizing;
    va_copy(sizing, args);
    int len = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);

    std::string out;
    if (len > 0) {
        out.resize(static_cast<size_t>(len));
        std::vsnprintf(&out[0], out.size() + 1, fmt, args);
    }
    va_end(args);
    return out;
}

const char* gate_status_name(GateStatus s) {
    switch (s) {
    case GateStatus::Passed:  return "passed";
    case GateStatus::Failed:  return "failed";
    case GateStatus::Warning: return "warning";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Rule construction
// ---------------------------------------------------------------------------

namespace {

struct KindName {
    const char* operator()(const MinimumScore&) const { return "minimum_score"; }
    const char* operator()(const DimensionFloor&) const { return "dimension_floor"; }
    const char* operator()(const NoRegression&) const { return "no_regression"; }
    const char* operator()(const BenchmarkFreshness&) const { return "benchmark_freshness"; }
};

Result<double> require_number(const std::optional<double>& v, const char* key,
                              const std::string& rule_id) {
    if (!v.has_value()) {
        return ScribeError{ScribeError::Config,
            "gate rule '" + rule_id + "' is missing '" + key + "'"};
    }
    return Result<double>::ok(*v);
}

Result<double> require_score(const std::optional<double>& v, const char* key,
                             const std::string& rule_id) {
    auto n = require_number(v, key, rule_id);
    if (n.is_err()) return n;
    if (n.value() < 0.0 || n.value() > 100.0) {
        return ScribeError{ScribeError::Config,
            "gate rule '" + rule_id + "': '" + key + "' must be within [0, 100]"};
    }
    return n;
}

} // namespace

const char* QualityGateRule::kind() const {
    return std::visit(KindName{}, params);
}

Result<QualityGateRule> QualityGateRule::make(const std::string& id,
                                              const std::string& name,
                                              const std::string& kind,
                                              const RuleParameters& params,
                                              bool blocking) {
    if (id.empty()) {
        return ScribeError{ScribeError::Config, "gate rule is missing an id"};
    }

    QualityGateRule rule;
    rule.id = id;
    rule.name = name.empty() ? id : name;
    rule.blocking = blocking;

    if (kind == "minimum_score") {
        auto t = require_score(params.threshold, "threshold", id);
        if (t.is_err()) return std::move(t).error();
        rule.params = MinimumScore{t.value()};
    } else if (kind == "dimension_floor") {
        if (!params.dimension.has_value() || params.dimension->empty()) {
            return ScribeError{ScribeError::Config,
                "gate rule '" + id + "' is missing 'dimension'"};
        }
        auto t = require_score(params.threshold, "threshold", id);
        if (t.is_err()) return std::move(t).error();
        rule.params = DimensionFloor{*params.dimension, t.value()};
    } else if (kind == "no_regression") {
        auto tol = require_number(params.tolerance, "tolerance", id);
        if (tol.is_err()) return std::move(tol).error();
        if (tol.value() < 0.0) {
            return ScribeError{ScribeError::Config,
                "gate rule '" + id + "': 'tolerance' must be non-negative"};
        }
        rule.params = NoRegression{tol.value()};
    } else if (kind == "benchmark_freshness") {
        auto age = require_number(params.max_age_hours, "max_age_hours", id);
        if (age.is_err()) return std::move(age).error();
        if (age.value() <= 0.0) {
            return ScribeError{ScribeError::Config,
                "gate rule '" + id + "': 'max_age_hours' must be positive"};
        }
        rule.params = BenchmarkFreshness{age.value()};
    } else {
        return ScribeError{ScribeError::UnsupportedRule,
            "gate rule '" + id + "' has unsupported kind '" + kind + "'",
            "supported kinds: minimum_score, dimension_floor, no_regression, benchmark_freshness"};
    }
    return Result<QualityGateRule>::ok(std::move(rule));
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

namespace {

// Outcome of one rule's condition, before blocking is applied
struct Check {
    bool holds;
    std::string message;
};

// The entry immediately preceding `latest` by executed_at. Ties keep the
// first one in history order.
const BenchmarkResult* find_prior(const BenchmarkResult& latest,
                                  const std::vector<BenchmarkResult>& history) {
    const BenchmarkResult* prior = nullptr;
    for (const auto& h : history) {
        if (h.id == latest.id) continue;
        if (h.executed_at > latest.executed_at) continue;
        if (!prior || h.executed_at > prior->executed_at) prior = &h;
    }
    return prior;
}

struct RuleChecker {
    const BenchmarkResult& latest;
    const std::vector<BenchmarkResult>& history;
    int64_t now_ms;

    Check operator()(const MinimumScore& p) const {
        if (latest.overall_score >= p.threshold) {
            return {true, format_msg("score %.1f meets threshold %.1f",
                                     latest.overall_score, p.threshold)};
        }
        return {false, format_msg("score %.1f below threshold %.1f",
                                  latest.overall_score, p.threshold)};
    }

    Check operator()(const DimensionFloor& p) const {
        auto it = latest.dimension_scores.find(p.dimension);
        if (it == latest.dimension_scores.end()) {
            return {false, "dimension '" + p.dimension + "' missing from benchmark result"};
        }
        if (it->second >= p.threshold) {
            return {true, format_msg("%s score %.1f meets threshold %.1f",
                                     p.dimension.c_str(), it->second, p.threshold)};
        }
        return {false, format_msg("%s score %.1f below threshold %.1f",
                                  p.dimension.c_str(), it->second, p.threshold)};
    }

    Check operator()(const NoRegression& p) const {
        const BenchmarkResult* prior = find_prior(latest, history);
        if (!prior) {
            return {true, "no prior benchmark result to compare against"};
        }
        if (latest.overall_score >= prior->overall_score - p.tolerance) {
            return {true, format_msg("score %.1f within %.1f of prior %.1f",
                                     latest.overall_score, p.tolerance, prior->overall_score)};
        }
        return {false, format_msg("score dropped from %.1f to %.1f (tolerance %.1f)",
                                  prior->overall_score, latest.overall_score, p.tolerance)};
    }

    Check operator()(const BenchmarkFreshness& p) const {
        double age_hours = static_cast<double>(now_ms - latest.executed_at) / 3600000.0;
        if (age_hours <= p.max_age_hours) {
            return {true, format_msg("benchmark is %.1f hours old", age_hours)};
        }
        return {false, format_msg("benchmark is stale (%.1f hours old, max %.1f)",
                                  age_hours, p.max_age_hours)};
    }
};

std::string summarize(const std::vector<GateEvaluation>& evaluations, bool can_deploy) {
    int passed = 0, failed = 0, warned = 0;
    for (const auto& e : evaluations) {
        switch (e.status) {
        case GateStatus::Passed:  ++passed; break;
        case GateStatus::Failed:  ++failed; break;
        case GateStatus::Warning: ++warned; break;
        }
    }
    return format_msg("%d passed, %d failed, %d warning(s): deployment %s",
                      passed, failed, warned, can_deploy ? "allowed" : "blocked");
}

} // namespace

GateVerdict evaluate(const std::vector<QualityGateRule>& rules,
                     const BenchmarkResult& latest,
                     const std::vector<BenchmarkResult>& history,
                     int64_t now_ms) {
    RuleChecker checker{latest, history, now_ms};

    GateVerdict verdict;
    verdict.can_deploy = true;
    for (const auto& rule : rules) {
        Check check = std::visit(checker, rule.params);

        GateEvaluation ev;
        ev.rule_id = rule.id;
        ev.rule_name = rule.name;
        ev.message = std::move(check.message);
        ev.blocking = rule.blocking;
        if (check.holds) {
            ev.status = GateStatus::Passed;
        } else if (rule.blocking) {
            ev.status = GateStatus::Failed;
            verdict.can_deploy = false;
            verdict.blockers.push_back(ev.message);
        } else {
            ev.status = GateStatus::Warning;
            verdict.warnings.push_back(ev.message);
        }
        verdict.evaluations.push_back(std::move(ev));
    }
    verdict.summary = summarize(verdict.evaluations, verdict.can_deploy);
    return verdict;
}

Result<GateVerdict> evaluate(const std::vector<RuleDefinition>& rules,
                             const BenchmarkResult& latest,
                             const std::vector<BenchmarkResult>& history,
                             int64_t now_ms) {
    std::vector<QualityGateRule> typed;
    typed.reserve(rules.size());
    for (const auto& def : rules) {
        auto rule = QualityGateRule::make(def.id, def.name, def.kind, def.params, def.blocking);
        if (rule.is_err()) return std::move(rule).error();
        typed.push_back(std::move(rule).value());
    }
    return Result<GateVerdict>::ok(evaluate(typed, latest, history, now_ms));
}

} // namespace scribe
