#pragma once

#include <scribe/result.hpp>
#include <scribe/core/model.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace scribe {

// Durable storage of artifacts, versions and benchmark results.
//
// Lookups that miss return NotFound. The head pointer of an artifact only
// moves through append_version, which is a compare-and-swap: it succeeds only
// while the stored head id equals `expected_head_id` (empty meaning "no
// versions yet") and fails with VersionConflict otherwise.
class Repository {
public:
    virtual ~Repository() = default;

    // Artifacts
    virtual Status insert_artifact(const Artifact& artifact) = 0;
    virtual Result<Artifact> find_artifact(const std::string& artifact_id) = 0;
    virtual Result<Artifact> find_artifact_by_slug(const std::string& slug) = 0;
    virtual Status update_artifact_status(const std::string& artifact_id,
                                          ArtifactStatus status,
                                          const std::string& version_string) = 0;
    // Removes the artifact with all of its versions and benchmark results
    virtual Status delete_artifact(const std::string& artifact_id) = 0;

    // Versions
    virtual Result<Version> head(const std::string& artifact_id) = 0;
    virtual Status append_version(const Version& version,
                                  const std::string& expected_head_id) = 0;
    virtual Result<Version> find_version(const std::string& artifact_id,
                                         const std::string& version_string) = 0;
    virtual Result<Version> find_version_by_id(const std::string& version_id) = 0;
    // Newest first
    virtual Result<std::vector<Version>> list_versions(const std::string& artifact_id,
                                                       size_t limit, size_t offset) = 0;

    // Benchmark results (append-only)
    virtual Status append_benchmark(const BenchmarkResult& result) = 0;
    // Newest executed_at first; limit 0 means unlimited
    virtual Result<std::vector<BenchmarkResult>> benchmark_history(
        const std::string& artifact_id, size_t limit) = 0;
    virtual Result<std::vector<BenchmarkResult>> version_benchmarks(
        const std::string& version_id) = 0;
};

} // namespace scribe
