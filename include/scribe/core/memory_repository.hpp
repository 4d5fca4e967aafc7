#pragma once

#include <scribe/core/repository.hpp>
#include <mutex>
#include <unordered_map>

namespace scribe {

// Process-local Repository. Every call takes one internal lock.
class MemoryRepository : public Repository {
public:
    Status insert_artifact(const Artifact& artifact) override;
    Result<Artifact> find_artifact(const std::string& artifact_id) override;
    Result<Artifact> find_artifact_by_slug(const std::string& slug) override;
    Status update_artifact_status(const std::string& artifact_id,
                                  ArtifactStatus status,
                                  const std::string& version_string) override;
    Status delete_artifact(const std::string& artifact_id) override;

    Result<Version> head(const std::string& artifact_id) override;
    Status append_version(const Version& version,
                          const std::string& expected_head_id) override;
    Result<Version> find_version(const std::string& artifact_id,
                                 const std::string& version_string) override;
    Result<Version> find_version_by_id(const std::string& version_id) override;
    Result<std::vector<Version>> list_versions(const std::string& artifact_id,
                                               size_t limit, size_t offset) override;

    Status append_benchmark(const BenchmarkResult& result) override;
    Result<std::vector<BenchmarkResult>> benchmark_history(
        const std::string& artifact_id, size_t limit) override;
    Result<std::vector<BenchmarkResult>> version_benchmarks(
        const std::string& version_id) override;

private:
    struct Entry {
        Artifact artifact;
        std::vector<Version> versions;           // append order, back() is head
        std::vector<BenchmarkResult> benchmarks; // append order
    };

    Entry* find_entry(const std::string& artifact_id);

    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, std::string> version_owner_;  // version id -> artifact id
};

} // namespace scribe
