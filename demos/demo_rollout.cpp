// demo_rollout.cpp
//
// A small standalone program that walks one prompt through its lifecycle:
// versions, a rollback, two benchmark runs and a rollout check. Run it with:
//
//     ./demo_rollout                           # in-memory database, built-in gates
//     ./demo_rollout gates.toml                # gates read from a config file
//     ./demo_rollout gates.toml prompts.db     # keep the history on disk
//
// ~/.scribe/config.toml (or $SCRIBE_HOME/config.toml) is layered underneath
// the given file when it exists. A [storage] path in either file is used when
// no database argument is given.
//
// Watch stderr for log output; the verdict and the diff go to stdout.

#include <scribe/config.hpp>
#include <scribe/log.hpp>
#include <scribe/result.hpp>
#include <scribe/core/rollout.hpp>
#include <scribe/core/sqlite_repository.hpp>

#include <iostream>
#include <optional>
#include <string>

using namespace scribe;

static const char* kDefaultGates = R"(
[[gates.production]]
id = "min-score"
name = "Minimum overall score"
kind = "minimum_score"
threshold = 75

[[gates.production]]
id = "no-regression"
name = "No regression"
kind = "no_regression"
tolerance = 2
blocking = false

[[gates.production]]
id = "safety-floor"
kind = "dimension_floor"
dimension = "safety"
threshold = 65
)";

// ---------------------------------------------------------------------------
// Pipeline steps, each returning Result<T> so failures carry a hint
// ---------------------------------------------------------------------------

Result<Config> load_config(int argc, char** argv) {
    std::optional<Config> global;
    auto global_cfg = Config::load(global_config_path());
    if (global_cfg.is_ok()) {
        log::info("using global config %s", global_config_path().c_str());
        global = std::move(global_cfg).value();
    } else if (!global_cfg.is_err(ScribeError::IO)) {
        return std::move(global_cfg).error();
    }

    auto project = argc >= 2 ? Config::load(argv[1]) : Config::parse(kDefaultGates);
    if (project.is_err()) return project;
    if (argc >= 2) log::info("loading gates from %s", argv[1]);
    return Result<Config>::ok(Config::effective(global, project.value()));
}

std::string database_path(int argc, char** argv, const Config& cfg) {
    if (argc >= 3) return argv[2];
    if (!cfg.storage.path.empty()) return cfg.resolved_storage_path();
    return ":memory:";
}

Result<std::string> build_history(VersionStore& store) {
    auto artifact = store.find_artifact("support-triage");
    if (artifact.is_err()) {
        artifact = store.create_artifact("support-triage");
        if (artifact.is_err()) return std::move(artifact).error();
    }
    const std::string id = artifact.value().id;

    SCRIBE_TRY(store.create_version(id,
        "You are a support agent.\nClassify the ticket.", "alice", "first draft"));
    SCRIBE_TRY(store.create_version(id,
        "You are a support agent.\nClassify the ticket.\nAnswer in one word.", "alice",
        "constrain output"));
    SCRIBE_TRY(store.create_version(id,
        "You are a terse support agent.\nClassify the ticket.\nAnswer in one word.", "bob",
        "tone"));

    auto d = store.diff(id, "1.0.0", "1.0.2");
    if (d.is_err()) return std::move(d).error();
    std::cout << DiffEngine::render_unified(d.value());

    SCRIBE_TRY(store.rollback(id, "1.0.1", "bob", "terse tone hurt accuracy"));
    return Result<std::string>::ok(id);
}

Status run_benchmarks(VersionStore& store, BenchmarkLedger& ledger, const Config& cfg,
                      const std::string& artifact_id) {
    RecordOptions opts;
    opts.gate_threshold = cfg.benchmark.gate_threshold;
    opts.weights = cfg.benchmark.weights;

    auto previous = store.get_version(artifact_id, std::string("1.0.1"));
    if (previous.is_err()) return std::move(previous).error();
    SCRIBE_TRY(ledger.record(previous.value().id, "smoke",
                             {{"clarity", 88.0}, {"safety", 82.0}}, opts));

    auto head = store.get_version(artifact_id);
    if (head.is_err()) return std::move(head).error();
    SCRIBE_TRY(ledger.record(head.value().id, "smoke",
                             {{"clarity", 90.0}, {"safety", 70.0}}, opts));

    auto trend = ledger.trend(artifact_id);
    if (trend.is_err()) return std::move(trend).error();
    log::info("trend: %s (%+.1f over %zu runs)", trend_name(trend.value().trend),
              trend.value().change, trend.value().samples);
    return ok_status();
}

Result<GateVerdict> process(int argc, char** argv) {
    auto cfg = load_config(argc, argv);
    if (cfg.is_err()) return std::move(cfg).error();
    if (cfg.value().log_level_set) {
        cfg.value().apply_logging();
    } else {
        log::set_level(log::Debug);
    }

    SqliteRepository repo;
    std::string db_path = database_path(argc, argv, cfg.value());
    log::debug("opening %s", db_path.c_str());
    SCRIBE_TRY(repo.open(db_path));

    DiffOptions diff_opts;
    diff_opts.max_lines = cfg.value().diff.max_lines;
    VersionStore store(repo, diff_opts);
    BenchmarkLedger ledger(repo);

    auto artifact_id = build_history(store);
    if (artifact_id.is_err()) return std::move(artifact_id).error();

    SCRIBE_TRY(run_benchmarks(store, ledger, cfg.value(), artifact_id.value()));

    RolloutGate gate(store, ledger, cfg.value());
    return gate.check_readiness(artifact_id.value(), "production");
}

int main(int argc, char** argv) {
    auto result = process(argc, argv);

    if (result.is_err()) {
        log::error("rollout check failed");
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }

    const GateVerdict& verdict = result.value();
    for (const auto& ev : verdict.evaluations) {
        std::cout << "  [" << gate_status_name(ev.status) << "] "
                  << ev.rule_name << ": " << ev.message << "\n";
    }
    std::cout << verdict.summary << "\n";
    return verdict.can_deploy ? 0 : 2;
}
