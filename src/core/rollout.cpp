#include <scribe/core/rollout.hpp>
#include <scribe/log.hpp>

namespace scribe {

RolloutGate::RolloutGate(VersionStore& store, BenchmarkLedger& ledger, Config config)
    : store_(store), ledger_(ledger),
      loader_([cfg = std::move(config)]() { return Result<Config>::ok(cfg); }) {}

RolloutGate::RolloutGate(VersionStore& store, BenchmarkLedger& ledger, ConfigLoader loader)
    : store_(store), ledger_(ledger), loader_(std::move(loader)) {}

RolloutGate RolloutGate::from_file(VersionStore& store, BenchmarkLedger& ledger,
                                   const std::string& path) {
    return RolloutGate(store, ledger, ConfigLoader([path]() { return Config::load(path); }));
}

Result<GateVerdict> RolloutGate::check_readiness(const std::string& artifact_id,
                                                 const std::string& environment,
                                                 std::optional<int64_t> now_ms) {
    auto head = store_.get_version(artifact_id);
    if (head.is_err()) return std::move(head).error();
    const Version& v = head.value();

    auto latest = ledger_.latest_for_version(v.id);
    if (latest.is_err()) {
        if (latest.is_err(ScribeError::NotFound)) {
            return ScribeError{ScribeError::NotFound,
                "version " + v.version_string + " of " + artifact_id + " has no benchmark result",
                "run a benchmark suite against the head version before rollout"};
        }
        return std::move(latest).error();
    }

    auto history = ledger_.history(artifact_id, 0);
    if (history.is_err()) return std::move(history).error();

    auto cfg = loader_();
    if (cfg.is_err()) return std::move(cfg).error();
    auto rules = cfg.value().rules_for(environment);
    if (rules.is_err()) return std::move(rules).error();

    GateVerdict verdict = evaluate(rules.value(), latest.value(), history.value(),
                                   now_ms.value_or(now_millis()));

    if (verdict.can_deploy) {
        log::info("%s %s may deploy to %s: %s", artifact_id.c_str(),
                  v.version_string.c_str(), environment.c_str(), verdict.summary.c_str());
    } else {
        log::warn("%s %s blocked for %s: %s", artifact_id.c_str(),
                  v.version_string.c_str(), environment.c_str(), verdict.summary.c_str());
    }
    for (const auto& w : verdict.warnings) {
        log::debug("  warning: %s", w.c_str());
    }
    return Result<GateVerdict>::ok(std::move(verdict));
}

} // namespace scribe
