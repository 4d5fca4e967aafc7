#include <scribe/core/version_store.hpp>
#include <scribe/content_hash.hpp>
#include <scribe/log.hpp>
#include <scribe/uuid.hpp>
#include <algorithm>
#include <cctype>

namespace scribe {

// Recompute the fingerprint of a version read back from the repository
static Result<Version> verified(Result<Version> loaded) {
    if (loaded.is_err()) return loaded;
    const Version& v = loaded.value();
    if (!ContentHasher::verify(v.content, v.content_hash)) {
        return ScribeError{ScribeError::Checksum,
            "content hash mismatch for version " + v.version_string +
            " of artifact " + v.artifact_id,
            "the stored content was modified outside scribe"};
    }
    return loaded;
}

VersionStore::VersionStore(Repository& repo, DiffOptions opts)
    : repo_(repo), engine_(opts) {}

std::shared_ptr<std::mutex> VersionStore::artifact_lock(const std::string& artifact_id) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    auto& slot = locks_[artifact_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void VersionStore::release_lock(const std::string& artifact_id) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    locks_.erase(artifact_id);
}

size_t VersionStore::lock_count() {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    return locks_.size();
}

// ---------------------------------------------------------------------------
// Artifacts
// ---------------------------------------------------------------------------

Result<Artifact> VersionStore::create_artifact(const std::string& slug) {
    if (slug.empty()) {
        return ScribeError{ScribeError::InvalidArg, "artifact slug must not be empty"};
    }
    bool has_space = std::any_of(slug.begin(), slug.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
    if (has_space) {
        return ScribeError{ScribeError::InvalidArg,
            "artifact slug must not contain whitespace: '" + slug + "'",
            "use dashes or underscores, e.g. 'support-triage'"};
    }

    Artifact a;
    a.id = new_id();
    a.slug = slug;
    a.status = ArtifactStatus::Draft;
    a.created_at = now_millis();
    SCRIBE_TRY(repo_.insert_artifact(a));

    log::info("registered artifact %s (%s)", slug.c_str(), a.id.c_str());
    return Result<Artifact>::ok(std::move(a));
}

Result<Artifact> VersionStore::get_artifact(const std::string& artifact_id) {
    return repo_.find_artifact(artifact_id);
}

Result<Artifact> VersionStore::find_artifact(const std::string& slug) {
    return repo_.find_artifact_by_slug(slug);
}

Status VersionStore::set_status(const std::string& artifact_id, ArtifactStatus status,
                                const std::string& version_string) {
    // A status always points at an existing version
    SCRIBE_TRY(repo_.find_version(artifact_id, version_string));
    SCRIBE_TRY(repo_.update_artifact_status(artifact_id, status, version_string));
    log::info("artifact %s is now %s at %s", artifact_id.c_str(),
              artifact_status_name(status), version_string.c_str());
    return ok_status();
}

Status VersionStore::delete_artifact(const std::string& artifact_id) {
    SCRIBE_TRY(repo_.find_artifact(artifact_id));
    {
        auto mutex = artifact_lock(artifact_id);
        std::lock_guard<std::mutex> lock(*mutex);
        SCRIBE_TRY(repo_.delete_artifact(artifact_id));
    }
    // Writers still holding the old lock fail on the missing artifact
    release_lock(artifact_id);
    log::info("deleted artifact %s", artifact_id.c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

Result<Version> VersionStore::create_version(const std::string& artifact_id,
                                             const std::string& content,
                                             const std::string& author_id,
                                             const std::string& change_summary,
                                             const std::optional<std::string>& explicit_version) {
    return write_version(artifact_id, content, author_id, change_summary,
                         explicit_version, Bump::Patch);
}

Result<Version> VersionStore::create_version(const std::string& artifact_id,
                                             const std::string& content,
                                             const std::string& author_id,
                                             const std::string& change_summary,
                                             Bump bump) {
    return write_version(artifact_id, content, author_id, change_summary,
                         std::nullopt, bump);
}

Result<Version> VersionStore::write_version(const std::string& artifact_id,
                                            const std::string& content,
                                            const std::string& author_id,
                                            const std::string& change_summary,
                                            const std::optional<std::string>& explicit_version,
                                            Bump bump) {
    // Unknown ids never get a lock slot
    SCRIBE_TRY(repo_.find_artifact(artifact_id));
    auto mutex = artifact_lock(artifact_id);
    std::lock_guard<std::mutex> lock(*mutex);

    auto hash = ContentHasher::hash(content);
    if (hash.is_err()) return std::move(hash).error();

    // Every stored version must stay diffable against its successor
    size_t lines = split_lines(content).size();
    if (lines > engine_.options().max_lines) {
        return ScribeError{ScribeError::ContentTooLarge,
            "content has " + std::to_string(lines) + " lines, limit is " +
                std::to_string(engine_.options().max_lines),
            "raise [diff] max_lines or split the artifact"};
    }

    std::optional<Version> head;
    auto current = verified(repo_.head(artifact_id));
    if (current.is_ok()) {
        head = std::move(current).value();
    } else if (!current.is_err(ScribeError::NotFound)) {
        return std::move(current).error();
    }

    if (head && head->content_hash == hash.value()) {
        log::debug("content of %s unchanged, head stays at %s",
                   artifact_id.c_str(), head->version_string.c_str());
        return Result<Version>::ok(std::move(*head));
    }

    std::optional<SemVer> head_ver;
    if (head) {
        auto parsed = SemVer::parse(head->version_string);
        if (parsed.is_err()) {
            return ScribeError{ScribeError::Storage,
                "stored head version of " + artifact_id + " is malformed: " +
                parsed.error().message};
        }
        head_ver = parsed.value();
    }

    SemVer next;
    if (explicit_version.has_value()) {
        auto parsed = SemVer::parse(*explicit_version);
        if (parsed.is_err()) return std::move(parsed).error();
        next = parsed.value();
        if (head_ver && next <= *head_ver) {
            return ScribeError{ScribeError::VersionConflict,
                "version " + next.to_string() + " is not greater than head " +
                head_ver->to_string(),
                "pick a version above " + head_ver->to_string() + " or omit it"};
        }
    } else if (head_ver) {
        auto bumped = head_ver->bumped(bump);
        if (bumped.is_err()) return std::move(bumped).error();
        next = bumped.value();
    } else {
        next = SemVer::initial();
    }

    Version v;
    v.id = new_id();
    v.artifact_id = artifact_id;
    v.version_string = next.to_string();
    v.content = content;
    v.content_hash = hash.value();
    v.change_summary = change_summary;
    v.author_id = author_id;
    v.created_at = now_millis();

    if (head) {
        auto chunks = engine_.diff(head->content, content);
        if (chunks.is_err()) return std::move(chunks).error();
        v.diff_from_parent = std::move(chunks).value();
        v.created_at = std::max(v.created_at, head->created_at);
    }

    SCRIBE_TRY(repo_.append_version(v, head ? head->id : std::string()));

    log::info("created %s %s (%s)", artifact_id.c_str(), v.version_string.c_str(),
              head ? head->version_string.c_str() : "first version");
    return Result<Version>::ok(std::move(v));
}

Result<Version> VersionStore::rollback(const std::string& artifact_id,
                                       const std::string& to_version,
                                       const std::string& author_id,
                                       const std::string& reason) {
    auto target = get_version(artifact_id, to_version);
    if (target.is_err()) return target;

    std::string summary = "Rollback to version " + to_version + ": " + reason;
    auto v = create_version(artifact_id, target.value().content, author_id, summary);
    if (v.is_ok()) {
        log::info("rolled %s back to %s", artifact_id.c_str(), to_version.c_str());
    }
    return v;
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

Result<Version> VersionStore::get_version(const std::string& artifact_id,
                                          const std::optional<std::string>& version_string) {
    if (!version_string.has_value()) {
        return verified(repo_.head(artifact_id));
    }
    return verified(repo_.find_version(artifact_id, *version_string));
}

Result<Version> VersionStore::get_version_by_id(const std::string& version_id) {
    return verified(repo_.find_version_by_id(version_id));
}

Result<std::vector<Version>> VersionStore::list_versions(const std::string& artifact_id,
                                                         size_t limit, size_t offset) {
    auto versions = repo_.list_versions(artifact_id, limit, offset);
    if (versions.is_err()) return versions;
    for (const auto& v : versions.value()) {
        if (!ContentHasher::verify(v.content, v.content_hash)) {
            return ScribeError{ScribeError::Checksum,
                "content hash mismatch for version " + v.version_string +
                " of artifact " + v.artifact_id};
        }
    }
    return versions;
}

Result<DiffResult> VersionStore::diff(const std::string& artifact_id,
                                      const std::string& from_version,
                                      const std::string& to_version) {
    auto cmp = compare(artifact_id, from_version, to_version);
    if (cmp.is_err()) return std::move(cmp).error();
    return Result<DiffResult>::ok(std::move(cmp).value().diff);
}

Result<VersionComparison> VersionStore::compare(const std::string& artifact_id,
                                                const std::string& from_version,
                                                const std::string& to_version) {
    auto from = get_version(artifact_id, from_version);
    if (from.is_err()) return std::move(from).error();
    auto to = get_version(artifact_id, to_version);
    if (to.is_err()) return std::move(to).error();

    VersionComparison cmp;
    cmp.diff.from_version = from_version;
    cmp.diff.to_version = to_version;
    cmp.from_hash = from.value().content_hash;
    cmp.to_hash = to.value().content_hash;
    cmp.from_created_at = from.value().created_at;
    cmp.to_created_at = to.value().created_at;

    if (!cmp.identical()) {
        auto chunks = engine_.diff(from.value().content, to.value().content);
        if (chunks.is_err()) return std::move(chunks).error();
        cmp.diff.chunks = std::move(chunks).value();
    }
    return Result<VersionComparison>::ok(std::move(cmp));
}

} // namespace scribe
