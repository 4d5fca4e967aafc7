#pragma once

#include <scribe/result.hpp>
#include <scribe/core/model.hpp>
#include <scribe/core/repository.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

using ScoreMap = std::map<std::string, double>;

struct Aggregate {
    double overall_score = 0.0;
    std::optional<double> delta;  // present iff a baseline was given
    bool gate_passed = false;
};

// Weighted mean of the dimension scores, rounded to one decimal and kept
// within [min score, max score]. Dimensions without an entry in `weights`
// weigh 1, so an empty map is the uniform mean.
//
// Errors: NoScores for an empty map; InvalidArg for a score outside
// [0, 100], a negative weight, or weights summing to zero.
Result<Aggregate> aggregate(const ScoreMap& scores,
                            std::optional<double> baseline,
                            double gate_threshold,
                            const ScoreMap& weights = {});

// Round half away from zero to one decimal place
double round1(double value);

enum class Trend {
    Improving,
    Declining,
    Stable,
    Neutral,  // fewer than two results
};

const char* trend_name(Trend t);

struct TrendReport {
    Trend trend = Trend::Neutral;
    double change = 0.0;                 // newest - oldest over the window
    std::optional<double> current_score; // newest overall score
    size_t samples = 0;
};

struct RecordOptions {
    std::optional<double> baseline;      // defaults to the previous latest result
    double gate_threshold = 70.0;
    ScoreMap weights;
    std::optional<int64_t> executed_at;  // defaults to now
};

// Benchmark results attached to versions
class BenchmarkLedger {
public:
    explicit BenchmarkLedger(Repository& repo) : repo_(repo) {}

    // Aggregate the scores and append a result for `version_id`
    Result<BenchmarkResult> record(const std::string& version_id,
                                   const std::string& suite_id,
                                   const ScoreMap& scores,
                                   const RecordOptions& opts = {});

    // Greatest executed_at across the artifact's versions
    Result<BenchmarkResult> latest(const std::string& artifact_id);
    Result<BenchmarkResult> latest_for_version(const std::string& version_id);

    // Newest first; limit 0 means everything
    Result<std::vector<BenchmarkResult>> history(const std::string& artifact_id,
                                                 size_t limit = 20);

    Result<TrendReport> trend(const std::string& artifact_id, size_t limit = 100);

private:
    Repository& repo_;
};

} // namespace scribe
