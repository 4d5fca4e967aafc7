#include <scribe/core/memory_repository.hpp>
#include <algorithm>

namespace scribe {

static ScribeError artifact_not_found(const std::string& artifact_id) {
    return ScribeError{ScribeError::NotFound, "artifact not found: " + artifact_id};
}

MemoryRepository::Entry* MemoryRepository::find_entry(const std::string& artifact_id) {
    auto it = entries_.find(artifact_id);
    return it == entries_.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// Artifacts
// ---------------------------------------------------------------------------

Status MemoryRepository::insert_artifact(const Artifact& artifact) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(artifact.id)) {
        return ScribeError{ScribeError::Duplicate,
            "artifact id already exists: " + artifact.id};
    }
    for (const auto& [id, entry] : entries_) {
        if (entry.artifact.slug == artifact.slug) {
            return ScribeError{ScribeError::Duplicate,
                "artifact slug already exists: " + artifact.slug};
        }
    }
    entries_[artifact.id].artifact = artifact;
    return ok_status();
}

Result<Artifact> MemoryRepository::find_artifact(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(artifact_id);
    if (!e) return artifact_not_found(artifact_id);
    return Result<Artifact>::ok(e->artifact);
}

Result<Artifact> MemoryRepository::find_artifact_by_slug(const std::string& slug) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : entries_) {
        if (entry.artifact.slug == slug) {
            return Result<Artifact>::ok(entry.artifact);
        }
    }
    return ScribeError{ScribeError::NotFound, "no artifact with slug: " + slug};
}

Status MemoryRepository::update_artifact_status(const std::string& artifact_id,
                                                ArtifactStatus status,
                                                const std::string& version_string) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(artifact_id);
    if (!e) return artifact_not_found(artifact_id);
    e->artifact.status = status;
    e->artifact.status_version = version_string;
    return ok_status();
}

Status MemoryRepository::delete_artifact(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(artifact_id);
    if (!e) return artifact_not_found(artifact_id);
    for (const auto& v : e->versions) {
        version_owner_.erase(v.id);
    }
    entries_.erase(artifact_id);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Versions
// ---------------------------------------------------------------------------

Result<Version> MemoryRepository::head(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(artifact_id);
    if (!e) return artifact_not_found(artifact_id);
    if (e->versions.empty()) {
        return ScribeError{ScribeError::NotFound,
            "artifact has no versions: " + artifact_id};
    }
    return Result<Version>::ok(e->versions.back());
}

Status MemoryRepository::append_version(const Version& version,
                                        const std::string& expected_head_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(version.artifact_id);
    if (!e) return artifact_not_found(version.artifact_id);

    std::string current = e->versions.empty() ? "" : e->versions.back().id;
    if (current != expected_head_id) {
        return ScribeError{ScribeError::VersionConflict,
            "head of " + version.artifact_id + " moved during write",
            "reload the head version and retry"};
    }
    for (const auto& v : e->versions) {
        if (v.version_string == version.version_string) {
            return ScribeError{ScribeError::VersionConflict,
                "version " + version.version_string + " already exists"};
        }
    }

    e->versions.push_back(version);
    version_owner_[version.id] = version.artifact_id;
    return ok_status();
}

Result<Version> MemoryRepository::find_version(const std::string& artifact_id,
                                               const std::string& version_string) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(artifact_id);
    if (!e) return artifact_not_found(artifact_id);
    for (const auto& v : e->versions) {
        if (v.version_string == version_string) {
            return Result<Version>::ok(v);
        }
    }
    return ScribeError{ScribeError::NotFound,
        "version " + version_string + " not found for artifact " + artifact_id};
}

Result<Version> MemoryRepository::find_version_by_id(const std::string& version_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto owner = version_owner_.find(version_id);
    if (owner != version_owner_.end()) {
        Entry* e = find_entry(owner->second);
        if (e) {
            for (const auto& v : e->versions) {
                if (v.id == version_id) return Result<Version>::ok(v);
            }
        }
    }
    return ScribeError{ScribeError::NotFound, "version not found: " + version_id};
}

Result<std::vector<Version>> MemoryRepository::list_versions(const std::string& artifact_id,
                                                             size_t limit, size_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(artifact_id);
    if (!e) return artifact_not_found(artifact_id);

    std::vector<Version> out;
    size_t skipped = 0;
    for (auto it = e->versions.rbegin(); it != e->versions.rend(); ++it) {
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        if (out.size() >= limit) break;
        out.push_back(*it);
    }
    return Result<std::vector<Version>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Benchmarks
// ---------------------------------------------------------------------------

// Newest executed_at first; among equal timestamps the later append wins
static std::vector<BenchmarkResult> newest_first(const std::vector<BenchmarkResult>& in) {
    std::vector<BenchmarkResult> out(in.rbegin(), in.rend());
    std::stable_sort(out.begin(), out.end(),
        [](const BenchmarkResult& a, const BenchmarkResult& b) {
            return a.executed_at > b.executed_at;
        });
    return out;
}

Status MemoryRepository::append_benchmark(const BenchmarkResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(result.artifact_id);
    if (!e) return artifact_not_found(result.artifact_id);
    for (const auto& b : e->benchmarks) {
        if (b.id == result.id) {
            return ScribeError{ScribeError::Duplicate,
                "benchmark result already recorded: " + result.id};
        }
    }
    e->benchmarks.push_back(result);
    return ok_status();
}

Result<std::vector<BenchmarkResult>> MemoryRepository::benchmark_history(
        const std::string& artifact_id, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_entry(artifact_id);
    if (!e) return artifact_not_found(artifact_id);

    auto out = newest_first(e->benchmarks);
    if (limit > 0 && out.size() > limit) out.resize(limit);
    return Result<std::vector<BenchmarkResult>>::ok(std::move(out));
}

Result<std::vector<BenchmarkResult>> MemoryRepository::version_benchmarks(
        const std::string& version_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto owner = version_owner_.find(version_id);
    if (owner == version_owner_.end()) {
        return ScribeError{ScribeError::NotFound, "version not found: " + version_id};
    }
    Entry* e = find_entry(owner->second);

    std::vector<BenchmarkResult> matching;
    for (const auto& b : e->benchmarks) {
        if (b.version_id == version_id) matching.push_back(b);
    }
    return Result<std::vector<BenchmarkResult>>::ok(newest_first(matching));
}

} // namespace scribe
