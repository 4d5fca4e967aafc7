#pragma once

#include <scribe/result.hpp>
#include <scribe/version.hpp>
#include <scribe/core/diff.hpp>
#include <scribe/core/model.hpp>
#include <scribe/core/repository.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace scribe {

// Side-by-side view of two versions of one artifact
struct VersionComparison {
    DiffResult diff;
    std::string from_hash;
    std::string to_hash;
    int64_t from_created_at = 0;
    int64_t to_created_at = 0;

    bool identical() const { return from_hash == to_hash; }
};

// Owns the linear history of every artifact in a Repository.
//
// Writes to one artifact are serialized by a per-artifact lock held across
// the read of the head, the diff, and the append. Writers in other processes
// are caught by the repository's head compare-and-swap instead.
class VersionStore {
public:
    explicit VersionStore(Repository& repo, DiffOptions opts = {});

    // Artifacts
    Result<Artifact> create_artifact(const std::string& slug);
    Result<Artifact> get_artifact(const std::string& artifact_id);
    Result<Artifact> find_artifact(const std::string& slug);
    Status set_status(const std::string& artifact_id, ArtifactStatus status,
                      const std::string& version_string);
    Status delete_artifact(const std::string& artifact_id);

    // Appends a version unless the content matches the head, in which case
    // the head is returned unchanged. Without an explicit version the head's
    // patch component is bumped (1.0.0 for the first version).
    Result<Version> create_version(const std::string& artifact_id,
                                   const std::string& content,
                                   const std::string& author_id,
                                   const std::string& change_summary = "",
                                   const std::optional<std::string>& explicit_version = std::nullopt);

    Result<Version> create_version(const std::string& artifact_id,
                                   const std::string& content,
                                   const std::string& author_id,
                                   const std::string& change_summary,
                                   Bump bump);

    // Omitted version string means the head
    Result<Version> get_version(const std::string& artifact_id,
                                const std::optional<std::string>& version_string = std::nullopt);
    Result<Version> get_version_by_id(const std::string& version_id);
    Result<std::vector<Version>> list_versions(const std::string& artifact_id,
                                               size_t limit = 50, size_t offset = 0);

    Result<DiffResult> diff(const std::string& artifact_id,
                            const std::string& from_version,
                            const std::string& to_version);
    Result<VersionComparison> compare(const std::string& artifact_id,
                                      const std::string& from_version,
                                      const std::string& to_version);

    // New head carrying the content of `to_version`
    Result<Version> rollback(const std::string& artifact_id,
                             const std::string& to_version,
                             const std::string& author_id,
                             const std::string& reason);

    const DiffEngine& engine() const { return engine_; }

    // Artifacts that currently own a write lock
    size_t lock_count();

private:
    Result<Version> write_version(const std::string& artifact_id,
                                  const std::string& content,
                                  const std::string& author_id,
                                  const std::string& change_summary,
                                  const std::optional<std::string>& explicit_version,
                                  Bump bump);

    std::shared_ptr<std::mutex> artifact_lock(const std::string& artifact_id);
    void release_lock(const std::string& artifact_id);

    Repository& repo_;
    DiffEngine engine_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace scribe
