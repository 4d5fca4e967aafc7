#include <scribe/core/benchmark.hpp>
#include <scribe/log.hpp>
#include <scribe/uuid.hpp>
#include <algorithm>
#include <cmath>

namespace scribe {

double round1(double value) {
    return std::round(value * 10.0) / 10.0;
}

Result<Aggregate> aggregate(const ScoreMap& scores,
                            std::optional<double> baseline,
                            double gate_threshold,
                            const ScoreMap& weights) {
    if (scores.empty()) {
        return ScribeError{ScribeError::NoScores,
            "cannot aggregate an empty set of dimension scores"};
    }

    for (const auto& [name, w] : weights) {
        if (!(w >= 0.0)) {
            return ScribeError{ScribeError::InvalidArg,
                "weight for '" + name + "' must be non-negative"};
        }
    }

    double weighted = 0.0;
    double total_weight = 0.0;
    double lo = 100.0;
    double hi = 0.0;
    for (const auto& [name, score] : scores) {
        if (!(score >= 0.0 && score <= 100.0)) {
            return ScribeError{ScribeError::InvalidArg,
                "score for '" + name + "' is outside [0, 100]"};
        }
        auto it = weights.find(name);
        double w = it == weights.end() ? 1.0 : it->second;
        weighted += score * w;
        total_weight += w;
        lo = std::min(lo, score);
        hi = std::max(hi, score);
    }

    if (total_weight <= 0.0) {
        return ScribeError{ScribeError::InvalidArg,
            "dimension weights sum to zero",
            "give at least one scored dimension a positive weight"};
    }

    Aggregate agg;
    // Rounding may step just outside the observed range
    agg.overall_score = std::clamp(round1(weighted / total_weight), lo, hi);
    if (baseline.has_value()) {
        agg.delta = round1(agg.overall_score - *baseline);
    }
    agg.gate_passed = agg.overall_score >= gate_threshold;
    return Result<Aggregate>::ok(agg);
}

const char* trend_name(Trend t) {
    switch (t) {
    case Trend::Improving: return "improving";
    case Trend::Declining: return "declining";
    case Trend::Stable:    return "stable";
    case Trend::Neutral:   return "neutral";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// BenchmarkLedger
// ---------------------------------------------------------------------------

Result<BenchmarkResult> BenchmarkLedger::record(const std::string& version_id,
                                                const std::string& suite_id,
                                                const ScoreMap& scores,
                                                const RecordOptions& opts) {
    auto version = repo_.find_version_by_id(version_id);
    if (version.is_err()) return std::move(version).error();
    const std::string& artifact_id = version.value().artifact_id;

    std::optional<double> baseline = opts.baseline;
    if (!baseline.has_value()) {
        auto previous = repo_.benchmark_history(artifact_id, 1);
        if (previous.is_err()) return std::move(previous).error();
        if (!previous.value().empty()) {
            baseline = previous.value().front().overall_score;
        }
    }

    auto agg = aggregate(scores, baseline, opts.gate_threshold, opts.weights);
    if (agg.is_err()) return std::move(agg).error();

    BenchmarkResult r;
    r.id = new_id();
    r.version_id = version_id;
    r.artifact_id = artifact_id;
    r.suite_id = suite_id;
    r.dimension_scores = scores;
    r.overall_score = agg.value().overall_score;
    r.baseline_score = baseline;
    r.delta = agg.value().delta;
    r.gate_passed = agg.value().gate_passed;
    r.executed_at = opts.executed_at.value_or(now_millis());
    SCRIBE_TRY(repo_.append_benchmark(r));

    if (r.delta.has_value()) {
        log::info("benchmark %s on %s %s: %.1f (%+.1f)", suite_id.c_str(),
                  artifact_id.c_str(), version.value().version_string.c_str(),
                  r.overall_score, *r.delta);
    } else {
        log::info("benchmark %s on %s %s: %.1f", suite_id.c_str(),
                  artifact_id.c_str(), version.value().version_string.c_str(),
                  r.overall_score);
    }
    return Result<BenchmarkResult>::ok(std::move(r));
}

Result<BenchmarkResult> BenchmarkLedger::latest(const std::string& artifact_id) {
    auto hist = repo_.benchmark_history(artifact_id, 1);
    if (hist.is_err()) return std::move(hist).error();
    if (hist.value().empty()) {
        return ScribeError{ScribeError::NotFound,
            "no benchmark results for artifact " + artifact_id};
    }
    return Result<BenchmarkResult>::ok(std::move(hist.value().front()));
}

Result<BenchmarkResult> BenchmarkLedger::latest_for_version(const std::string& version_id) {
    auto results = repo_.version_benchmarks(version_id);
    if (results.is_err()) return std::move(results).error();
    if (results.value().empty()) {
        return ScribeError{ScribeError::NotFound,
            "no benchmark results for version " + version_id,
            "run a benchmark suite against this version first"};
    }
    return Result<BenchmarkResult>::ok(std::move(results.value().front()));
}

Result<std::vector<BenchmarkResult>> BenchmarkLedger::history(const std::string& artifact_id,
                                                              size_t limit) {
    return repo_.benchmark_history(artifact_id, limit);
}

Result<TrendReport> BenchmarkLedger::trend(const std::string& artifact_id, size_t limit) {
    auto hist = repo_.benchmark_history(artifact_id, limit);
    if (hist.is_err()) return std::move(hist).error();
    const auto& results = hist.value();

    TrendReport report;
    report.samples = results.size();
    if (!results.empty()) {
        report.current_score = results.front().overall_score;
    }
    if (results.size() >= 2) {
        report.change = round1(results.front().overall_score - results.back().overall_score);
        if (report.change > 0.0) {
            report.trend = Trend::Improving;
        } else if (report.change < 0.0) {
            report.trend = Trend::Declining;
        } else {
            report.trend = Trend::Stable;
        }
    }
    return Result<TrendReport>::ok(report);
}

} // namespace scribe
