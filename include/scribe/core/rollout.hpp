#pragma once

#include <scribe/result.hpp>
#include <scribe/config.hpp>
#include <scribe/core/benchmark.hpp>
#include <scribe/core/quality_gate.hpp>
#include <scribe/core/version_store.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace scribe {

// Source of the environment rule lists, consulted on every check
using ConfigLoader = std::function<Result<Config>()>;

// "Can this artifact's head deploy to <environment>?"
class RolloutGate {
public:
    RolloutGate(VersionStore& store, BenchmarkLedger& ledger, Config config);
    RolloutGate(VersionStore& store, BenchmarkLedger& ledger, ConfigLoader loader);

    // Re-reads the TOML file at `path` on every check
    static RolloutGate from_file(VersionStore& store, BenchmarkLedger& ledger,
                                 const std::string& path);

    // Errors: NotFound when the artifact has no versions or its head was
    // never benchmarked; Config when the environment has no rules;
    // UnsupportedRule (or other config errors) while loading the rules.
    Result<GateVerdict> check_readiness(const std::string& artifact_id,
                                        const std::string& environment,
                                        std::optional<int64_t> now_ms = std::nullopt);

private:
    VersionStore& store_;
    BenchmarkLedger& ledger_;
    ConfigLoader loader_;
};

} // namespace scribe
