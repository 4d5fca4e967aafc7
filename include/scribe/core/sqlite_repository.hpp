#pragma once

#include <scribe/core/repository.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace scribe {

// Repository backed by a SQLite database file (or ":memory:").
// One connection per instance, serialized by an internal lock; the head
// compare-and-swap runs inside a BEGIN IMMEDIATE transaction so it also
// holds across processes sharing the file.
class SqliteRepository : public Repository {
public:
    SqliteRepository();
    ~SqliteRepository() override;
    SqliteRepository(SqliteRepository&&) noexcept;
    SqliteRepository& operator=(SqliteRepository&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;
    static std::string default_db_path();

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
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Binary form of a chunk list as stored in the versions table
std::vector<uint8_t> encode_chunks(const std::vector<DiffChunk>& chunks);
Result<std::vector<DiffChunk>> decode_chunks(const uint8_t* data, size_t len);

} // namespace scribe
