#pragma once

#include <scribe/result.hpp>
#include <scribe/core/diff.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

enum class ArtifactStatus {
    Draft,
    Review,
    Staged,
    Deployed,
    Archived,
};

const char* artifact_status_name(ArtifactStatus s);
Result<ArtifactStatus> parse_artifact_status(const std::string& s);

// A named, versioned prompt
struct Artifact {
    std::string id;
    std::string slug;
    ArtifactStatus status = ArtifactStatus::Draft;
    std::string status_version;  // version the status refers to, empty before the first version
    int64_t created_at = 0;      // ms since epoch
};

// Immutable snapshot of an artifact's content
struct Version {
    std::string id;
    std::string artifact_id;
    std::string version_string;
    std::string content;
    std::string content_hash;
    std::optional<std::vector<DiffChunk>> diff_from_parent;  // absent for the first version
    std::string change_summary;
    std::string author_id;
    int64_t created_at = 0;      // ms since epoch, never below the parent's
};

struct BenchmarkResult {
    std::string id;
    std::string version_id;
    std::string artifact_id;
    std::string suite_id;
    std::map<std::string, double> dimension_scores;
    double overall_score = 0.0;
    std::optional<double> baseline_score;
    std::optional<double> delta;  // present iff baseline_score is
    bool gate_passed = false;
    int64_t executed_at = 0;      // ms since epoch
};

// Wall clock in milliseconds since the Unix epoch
int64_t now_millis();

} // namespace scribe
