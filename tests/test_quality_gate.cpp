#include <catch2/catch.hpp>
#include <scribe/core/quality_gate.hpp>

using namespace scribe;

static const int64_t kHour = 3600LL * 1000;

static BenchmarkResult result(const std::string& id, double score, int64_t executed_at,
                              std::map<std::string, double> dims = {}) {
    BenchmarkResult r;
    r.id = id;
    r.version_id = "v-" + id;
    r.artifact_id = "a1";
    r.suite_id = "smoke";
    r.dimension_scores = dims.empty() ? std::map<std::string, double>{{"clarity", score}} : dims;
    r.overall_score = score;
    r.executed_at = executed_at;
    return r;
}

static QualityGateRule rule(const std::string& id, const std::string& kind,
                            RuleParameters params, bool blocking = true) {
    return QualityGateRule::make(id, "", kind, params, blocking).value();
}

static RuleParameters threshold(double t) {
    RuleParameters p;
    p.threshold = t;
    return p;
}

static RuleParameters tolerance(double t) {
    RuleParameters p;
    p.tolerance = t;
    return p;
}

// ===== Rule construction =====

TEST_CASE("make builds typed rules", "[quality_gate]") {
    auto r = QualityGateRule::make("min", "Minimum score", "minimum_score", threshold(75), true);
    REQUIRE(r.is_ok());
    REQUIRE(std::string(r.value().kind()) == "minimum_score");
    REQUIRE(std::get<MinimumScore>(r.value().params).threshold == Approx(75.0));
    REQUIRE(r.value().name == "Minimum score");

    RuleParameters floor = threshold(60);
    floor.dimension = "safety";
    auto f = QualityGateRule::make("safety-floor", "", "dimension_floor", floor, false);
    REQUIRE(f.is_ok());
    REQUIRE(f.value().name == "safety-floor");
    REQUIRE_FALSE(f.value().blocking);
    REQUIRE(std::get<DimensionFloor>(f.value().params).dimension == "safety");

    RuleParameters fresh;
    fresh.max_age_hours = 48;
    REQUIRE(std::string(rule("fresh", "benchmark_freshness", fresh).kind()) == "benchmark_freshness");
    REQUIRE(std::string(rule("noreg", "no_regression", tolerance(2)).kind()) == "no_regression");
}

TEST_CASE("make rejects unknown kinds and bad parameters", "[quality_gate]") {
    auto unknown = QualityGateRule::make("x", "", "toxicity_ceiling", threshold(10), true);
    REQUIRE(unknown.is_err());
    REQUIRE(unknown.error().code == ScribeError::UnsupportedRule);

    RuleParameters none;
    REQUIRE(QualityGateRule::make("x", "", "minimum_score", none, true).error().code ==
            ScribeError::Config);
    REQUIRE(QualityGateRule::make("x", "", "minimum_score", threshold(101), true).error().code ==
            ScribeError::Config);
    REQUIRE(QualityGateRule::make("x", "", "dimension_floor", threshold(50), true).error().code ==
            ScribeError::Config);
    REQUIRE(QualityGateRule::make("x", "", "no_regression", tolerance(-1), true).error().code ==
            ScribeError::Config);
    RuleParameters zero_age;
    zero_age.max_age_hours = 0;
    REQUIRE(QualityGateRule::make("x", "", "benchmark_freshness", zero_age, true).error().code ==
            ScribeError::Config);
    REQUIRE(QualityGateRule::make("", "", "minimum_score", threshold(1), true).error().code ==
            ScribeError::Config);
}

// ===== Evaluation =====

TEST_CASE("non-blocking regression only warns", "[quality_gate]") {
    std::vector<QualityGateRule> rules{
        rule("min", "minimum_score", threshold(75), true),
        rule("noreg", "no_regression", tolerance(2), false),
    };
    auto prior = result("r1", 85.0, 1000);
    auto latest = result("r2", 80.0, 2000);

    auto verdict = evaluate(rules, latest, {latest, prior}, 2000);
    REQUIRE(verdict.can_deploy);
    REQUIRE(verdict.evaluations.size() == 2);
    REQUIRE(verdict.evaluations[0].status == GateStatus::Passed);
    REQUIRE(verdict.evaluations[1].status == GateStatus::Warning);
    REQUIRE_FALSE(verdict.evaluations[1].blocking);
    REQUIRE(verdict.warnings.size() == 1);
    REQUIRE(verdict.blockers.empty());
    REQUIRE(verdict.summary == "1 passed, 0 failed, 1 warning(s): deployment allowed");
}

TEST_CASE("blocking failure denies deployment", "[quality_gate]") {
    std::vector<QualityGateRule> rules{
        rule("min", "minimum_score", threshold(75), true),
        rule("noreg", "no_regression", tolerance(2), true),
    };
    auto verdict = evaluate(rules, result("r2", 80.0, 2000), {result("r1", 85.0, 1000)}, 2000);
    REQUIRE_FALSE(verdict.can_deploy);
    REQUIRE(verdict.evaluations[1].status == GateStatus::Failed);
    REQUIRE(verdict.blockers.size() == 1);
    REQUIRE(verdict.blockers[0] == verdict.evaluations[1].message);
    REQUIRE(verdict.evaluations[1].message == "score dropped from 85.0 to 80.0 (tolerance 2.0)");
    REQUIRE(verdict.summary == "1 passed, 1 failed, 0 warning(s): deployment blocked");
}

TEST_CASE("empty rule list allows deployment", "[quality_gate]") {
    auto verdict = evaluate(std::vector<QualityGateRule>{}, result("r1", 10.0, 0), {}, 0);
    REQUIRE(verdict.can_deploy);
    REQUIRE(verdict.evaluations.empty());
}

TEST_CASE("raising a score never blocks a deployable result", "[quality_gate]") {
    RuleParameters floor = threshold(60);
    floor.dimension = "clarity";
    std::vector<QualityGateRule> rules{
        rule("min", "minimum_score", threshold(70)),
        rule("floor", "dimension_floor", floor),
        rule("noreg", "no_regression", tolerance(0)),
    };
    auto prior = result("r1", 72.0, 1000);
    for (double score = 72.0; score <= 100.0; score += 4.0) {
        auto v = evaluate(rules, result("r2", score, 2000), {prior}, 2000);
        REQUIRE(v.can_deploy);
    }
}

TEST_CASE("raising a threshold never unblocks a fixed result", "[quality_gate]") {
    auto latest = result("r1", 72.4, 0);
    bool seen_failed = false;
    bool seen_passed = false;
    for (int t = 0; t <= 100; ++t) {
        INFO("threshold " << t);
        std::vector<QualityGateRule> rules{rule("min", "minimum_score", threshold(t))};
        auto v = evaluate(rules, latest, {}, 0);
        REQUIRE(v.evaluations.size() == 1);
        GateStatus status = v.evaluations[0].status;
        if (seen_failed) {
            REQUIRE(status == GateStatus::Failed);
            REQUIRE_FALSE(v.can_deploy);
        }
        if (status == GateStatus::Failed) seen_failed = true;
        if (status == GateStatus::Passed) seen_passed = true;
    }
    REQUIRE(seen_passed);
    REQUIRE(seen_failed);
}

TEST_CASE("minimum_score boundary is inclusive", "[quality_gate]") {
    std::vector<QualityGateRule> rules{rule("min", "minimum_score", threshold(75))};
    REQUIRE(evaluate(rules, result("r", 75.0, 0), {}, 0).can_deploy);
    REQUIRE_FALSE(evaluate(rules, result("r", 74.9, 0), {}, 0).can_deploy);
}

TEST_CASE("dimension_floor", "[quality_gate]") {
    RuleParameters p = threshold(65);
    p.dimension = "safety";
    std::vector<QualityGateRule> rules{rule("floor", "dimension_floor", p)};

    auto ok = result("r", 80.0, 0, {{"clarity", 90.0}, {"safety", 70.0}});
    REQUIRE(evaluate(rules, ok, {}, 0).evaluations[0].status == GateStatus::Passed);

    auto low = result("r", 80.0, 0, {{"clarity", 95.0}, {"safety", 64.0}});
    REQUIRE(evaluate(rules, low, {}, 0).evaluations[0].status == GateStatus::Failed);

    auto missing = result("r", 80.0, 0, {{"clarity", 95.0}});
    auto v = evaluate(rules, missing, {}, 0);
    REQUIRE(v.evaluations[0].status == GateStatus::Failed);
    REQUIRE(v.evaluations[0].message == "dimension 'safety' missing from benchmark result");
}

TEST_CASE("long dimension names are not truncated", "[quality_gate]") {
    std::string dim(600, 'd');
    dim += "-tail";
    RuleParameters p = threshold(65);
    p.dimension = dim;
    std::vector<QualityGateRule> rules{rule("floor", "dimension_floor", p)};

    auto low = result("r", 80.0, 0, {{dim, 64.0}});
    auto v = evaluate(rules, low, {}, 0);
    REQUIRE(v.evaluations[0].message == dim + " score 64.0 below threshold 65.0");
}

TEST_CASE("no_regression picks the closest earlier result", "[quality_gate]") {
    std::vector<QualityGateRule> rules{rule("noreg", "no_regression", tolerance(1))};
    auto latest = result("r3", 80.0, 3000);

    SECTION("no prior result passes") {
        auto v = evaluate(rules, latest, {latest}, 3000);
        REQUIRE(v.evaluations[0].status == GateStatus::Passed);
        REQUIRE(v.evaluations[0].message == "no prior benchmark result to compare against");
    }
    SECTION("later results are ignored") {
        std::vector<BenchmarkResult> hist{result("r4", 95.0, 4000), latest,
                                          result("r2", 80.5, 2000), result("r1", 99.0, 1000)};
        REQUIRE(evaluate(rules, latest, hist, 4000).can_deploy);
    }
    SECTION("drop beyond tolerance fails") {
        std::vector<BenchmarkResult> hist{latest, result("r2", 81.5, 2000)};
        REQUIRE_FALSE(evaluate(rules, latest, hist, 3000).can_deploy);
    }
}

TEST_CASE("benchmark_freshness compares age in hours", "[quality_gate]") {
    RuleParameters p;
    p.max_age_hours = 24;
    std::vector<QualityGateRule> rules{rule("fresh", "benchmark_freshness", p)};
    auto r = result("r", 90.0, 0);

    REQUIRE(evaluate(rules, r, {}, 24 * kHour).can_deploy);
    auto stale = evaluate(rules, r, {}, 25 * kHour);
    REQUIRE_FALSE(stale.can_deploy);
    REQUIRE(stale.blockers[0] == "benchmark is stale (25.0 hours old, max 24.0)");
}

TEST_CASE("evaluate from definitions", "[quality_gate]") {
    RuleDefinition min{"min", "Minimum", "minimum_score", threshold(50), true};
    RuleDefinition bogus{"bogus", "", "vibes_check", {}, false};

    auto ok = evaluate(std::vector<RuleDefinition>{min}, result("r", 60.0, 0), {}, 0);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().can_deploy);
    REQUIRE(ok.value().evaluations[0].rule_name == "Minimum");

    auto bad = evaluate(std::vector<RuleDefinition>{min, bogus}, result("r", 60.0, 0), {}, 0);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == ScribeError::UnsupportedRule);
}

TEST_CASE("gate_status_name", "[quality_gate]") {
    REQUIRE(std::string(gate_status_name(GateStatus::Passed)) == "passed");
    REQUIRE(std::string(gate_status_name(GateStatus::Failed)) == "failed");
    REQUIRE(std::string(gate_status_name(GateStatus::Warning)) == "warning");
}
