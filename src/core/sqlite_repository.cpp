#include <scribe/core/sqlite_repository.hpp>
#include <scribe/config.hpp>
#include <scribe/log.hpp>
#include <sqlite3.h>

#include <cstring>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace scribe {

// ---------------------------------------------------------------------------
// Binary serialization helpers (varint + length-prefixed strings)
// ---------------------------------------------------------------------------

static const char MAGIC[] = "SDF\x01";
static constexpr size_t MAGIC_LEN = 4;

namespace ser {

static void write_varint(std::vector<uint8_t>& buf, uint64_t val) {
    while (val >= 0x80) {
        buf.push_back(static_cast<uint8_t>(val & 0x7F) | 0x80);
        val >>= 7;
    }
    buf.push_back(static_cast<uint8_t>(val));
}

static bool read_varint(const uint8_t*& p, const uint8_t* end, uint64_t& val) {
    val = 0;
    unsigned shift = 0;
    while (p < end) {
        uint8_t b = *p++;
        val |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (!(b & 0x80)) return true;
        shift += 7;
        if (shift >= 64) return false;
    }
    return false;
}

static void write_int(std::vector<uint8_t>& buf, int v) {
    write_varint(buf, static_cast<uint64_t>(static_cast<uint32_t>(v)));
}

static bool read_int(const uint8_t*& p, const uint8_t* end, int& v) {
    uint64_t raw;
    if (!read_varint(p, end, raw)) return false;
    v = static_cast<int>(static_cast<uint32_t>(raw));
    return true;
}

static void write_string(std::vector<uint8_t>& buf, const std::string& s) {
    write_varint(buf, s.size());
    buf.insert(buf.end(), s.begin(), s.end());
}

static bool read_string(const uint8_t*& p, const uint8_t* end, std::string& s) {
    uint64_t len;
    if (!read_varint(p, end, len)) return false;
    if (len > static_cast<uint64_t>(end - p)) return false;
    s.assign(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
    p += len;
    return true;
}

} // namespace ser

std::vector<uint8_t> encode_chunks(const std::vector<DiffChunk>& chunks) {
    std::vector<uint8_t> buf;
    buf.reserve(256);
    buf.insert(buf.end(), MAGIC, MAGIC + MAGIC_LEN);

    ser::write_varint(buf, chunks.size());
    for (const auto& c : chunks) {
        buf.push_back(static_cast<uint8_t>(c.kind));
        ser::write_int(buf, c.old_start);
        ser::write_int(buf, c.old_line_count);
        ser::write_int(buf, c.new_start);
        ser::write_int(buf, c.new_line_count);
        ser::write_varint(buf, c.lines.size());
        for (const auto& line : c.lines) {
            ser::write_string(buf, line);
        }
    }
    return buf;
}

Result<std::vector<DiffChunk>> decode_chunks(const uint8_t* data, size_t len) {
    if (len < MAGIC_LEN || std::memcmp(data, MAGIC, MAGIC_LEN) != 0) {
        return ScribeError(ScribeError::Checksum, "stored diff has invalid magic bytes");
    }

    const uint8_t* p = data + MAGIC_LEN;
    const uint8_t* end = data + len;

    uint64_t count;
    if (!ser::read_varint(p, end, count) || count > len) {
        return ScribeError(ScribeError::Storage, "corrupted diff: truncated chunk count");
    }

    std::vector<DiffChunk> chunks(static_cast<size_t>(count));
    for (auto& c : chunks) {
        if (p >= end) {
            return ScribeError(ScribeError::Storage, "corrupted diff: truncated chunk");
        }
        uint8_t kind = *p++;
        if (kind > static_cast<uint8_t>(ChunkKind::Remove)) {
            return ScribeError(ScribeError::Storage, "corrupted diff: unknown chunk kind");
        }
        c.kind = static_cast<ChunkKind>(kind);

        uint64_t n;
        if (!ser::read_int(p, end, c.old_start) ||
            !ser::read_int(p, end, c.old_line_count) ||
            !ser::read_int(p, end, c.new_start) ||
            !ser::read_int(p, end, c.new_line_count) ||
            !ser::read_varint(p, end, n) || n > len) {
            return ScribeError(ScribeError::Storage, "corrupted diff: truncated chunk header");
        }
        c.lines.resize(static_cast<size_t>(n));
        for (auto& line : c.lines) {
            if (!ser::read_string(p, end, line)) {
                return ScribeError(ScribeError::Storage, "corrupted diff: truncated line");
            }
        }
    }
    return Result<std::vector<DiffChunk>>::ok(std::move(chunks));
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

#define VERSION_COLUMNS \
    "id, artifact_id, version_string, content, content_hash, diff, " \
    "change_summary, author_id, created_at"

#define BENCHMARK_COLUMNS \
    "id, version_id, artifact_id, suite_id, overall_score, baseline_score, " \
    "delta, gate_passed, executed_at"

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

static void bind_string(sqlite3_stmt* stmt, int idx, const std::string& s) {
    sqlite3_bind_text(stmt, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void bind_optional_double(sqlite3_stmt* stmt, int idx, const std::optional<double>& v) {
    if (v.has_value()) {
        sqlite3_bind_double(stmt, idx, *v);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

static std::optional<double> column_optional_double(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(stmt, col);
}

// Resets a statement when a single-row read returns, so no read
// transaction stays open on the connection between calls
struct ResetOnExit {
    sqlite3_stmt* stmt;
    ~ResetOnExit() { sqlite3_reset(stmt); }
};

struct SqliteRepository::Impl {
    sqlite3* db = nullptr;
    std::mutex mutex;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_insert_artifact = nullptr;
    sqlite3_stmt* stmt_find_artifact = nullptr;
    sqlite3_stmt* stmt_find_artifact_slug = nullptr;
    sqlite3_stmt* stmt_update_status = nullptr;
    sqlite3_stmt* stmt_delete_artifact = nullptr;
    sqlite3_stmt* stmt_head = nullptr;
    sqlite3_stmt* stmt_move_head = nullptr;
    sqlite3_stmt* stmt_insert_version = nullptr;
    sqlite3_stmt* stmt_find_version = nullptr;
    sqlite3_stmt* stmt_find_version_id = nullptr;
    sqlite3_stmt* stmt_list_versions = nullptr;
    sqlite3_stmt* stmt_insert_benchmark = nullptr;
    sqlite3_stmt* stmt_insert_score = nullptr;
    sqlite3_stmt* stmt_history = nullptr;
    sqlite3_stmt* stmt_version_benchmarks = nullptr;
    sqlite3_stmt* stmt_scores = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_insert_artifact);
        fin(stmt_find_artifact);
        fin(stmt_find_artifact_slug);
        fin(stmt_update_status);
        fin(stmt_delete_artifact);
        fin(stmt_head);
        fin(stmt_move_head);
        fin(stmt_insert_version);
        fin(stmt_find_version);
        fin(stmt_find_version_id);
        fin(stmt_list_versions);
        fin(stmt_insert_benchmark);
        fin(stmt_insert_score);
        fin(stmt_history);
        fin(stmt_version_benchmarks);
        fin(stmt_scores);
    }

    Status require_open() const {
        if (!db) {
            return ScribeError(ScribeError::Storage, "repository is not open",
                "call SqliteRepository::open first");
        }
        return ok_status();
    }

    // Prepare once, then reset and clear bindings on every reuse
    Status prepare(const char* sql, sqlite3_stmt*& out) {
        SCRIBE_TRY(require_open());
        if (out) {
            sqlite3_reset(out);
            sqlite3_clear_bindings(out);
            return ok_status();
        }
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return ScribeError(ScribeError::Storage,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return ScribeError(ScribeError::Storage, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    // Step a statement that returns no rows
    Status step_done(sqlite3_stmt* stmt, const std::string& what) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) return ok_status();
        if (rc == SQLITE_CONSTRAINT_FOREIGNKEY) {
            return ScribeError(ScribeError::NotFound,
                what + ": referenced row does not exist");
        }
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
            return ScribeError(ScribeError::Duplicate,
                what + ": " + sqlite3_errmsg(db));
        }
        return ScribeError(ScribeError::Storage,
            what + " failed: " + sqlite3_errmsg(db));
    }

    void rollback() {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }

    Status init_schema() {
        SCRIBE_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS artifacts ("
            "  id TEXT PRIMARY KEY,"
            "  slug TEXT NOT NULL UNIQUE,"
            "  status TEXT NOT NULL,"
            "  status_version TEXT NOT NULL DEFAULT '',"
            "  head_version_id TEXT,"
            "  created_at INTEGER NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS versions ("
            "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  id TEXT NOT NULL UNIQUE,"
            "  artifact_id TEXT NOT NULL REFERENCES artifacts(id) ON DELETE CASCADE,"
            "  version_string TEXT NOT NULL,"
            "  content TEXT NOT NULL,"
            "  content_hash TEXT NOT NULL,"
            "  diff BLOB,"
            "  change_summary TEXT NOT NULL,"
            "  author_id TEXT NOT NULL,"
            "  created_at INTEGER NOT NULL,"
            "  UNIQUE (artifact_id, version_string)"
            ");"
            "CREATE TABLE IF NOT EXISTS benchmark_results ("
            "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  id TEXT NOT NULL UNIQUE,"
            "  version_id TEXT NOT NULL REFERENCES versions(id) ON DELETE CASCADE,"
            "  artifact_id TEXT NOT NULL REFERENCES artifacts(id) ON DELETE CASCADE,"
            "  suite_id TEXT NOT NULL,"
            "  overall_score REAL NOT NULL,"
            "  baseline_score REAL,"
            "  delta REAL,"
            "  gate_passed INTEGER NOT NULL,"
            "  executed_at INTEGER NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS dimension_scores ("
            "  result_id TEXT NOT NULL REFERENCES benchmark_results(id) ON DELETE CASCADE,"
            "  dimension TEXT NOT NULL,"
            "  score REAL NOT NULL,"
            "  PRIMARY KEY (result_id, dimension)"
            ");"
            "CREATE INDEX IF NOT EXISTS ix_versions_artifact ON versions (artifact_id, seq);"
            "CREATE INDEX IF NOT EXISTS ix_benchmarks_artifact "
            "  ON benchmark_results (artifact_id, executed_at);"
            "CREATE INDEX IF NOT EXISTS ix_benchmarks_version "
            "  ON benchmark_results (version_id, executed_at);"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return ScribeError(ScribeError::Storage,
                std::string("cannot read schema version: ") + sqlite3_errmsg(db));
        }

        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            std::string ver = column_string(stmt, 0);
            sqlite3_finalize(stmt);
            // Version history is not a cache: never wipe it on mismatch
            if (ver != SCHEMA_VERSION) {
                return ScribeError(ScribeError::Storage,
                    "unsupported database schema version " + ver,
                    "expected schema version " + SCHEMA_VERSION);
            }
            return ok_status();
        }
        sqlite3_finalize(stmt);

        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }

    Result<Artifact> read_artifact(sqlite3_stmt* stmt) {
        Artifact a;
        a.id = column_string(stmt, 0);
        a.slug = column_string(stmt, 1);
        auto status = parse_artifact_status(column_string(stmt, 2));
        if (status.is_err()) {
            return ScribeError(ScribeError::Storage,
                "corrupted artifact row " + a.id + ": " + status.error().message);
        }
        a.status = status.value();
        a.status_version = column_string(stmt, 3);
        a.created_at = sqlite3_column_int64(stmt, 4);
        return Result<Artifact>::ok(std::move(a));
    }

    Result<Version> read_version(sqlite3_stmt* stmt) {
        Version v;
        v.id = column_string(stmt, 0);
        v.artifact_id = column_string(stmt, 1);
        v.version_string = column_string(stmt, 2);
        v.content = column_string(stmt, 3);
        v.content_hash = column_string(stmt, 4);
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            const void* blob = sqlite3_column_blob(stmt, 5);
            int size = sqlite3_column_bytes(stmt, 5);
            auto chunks = decode_chunks(static_cast<const uint8_t*>(blob),
                                        static_cast<size_t>(size));
            if (chunks.is_err()) return std::move(chunks).error();
            v.diff_from_parent = std::move(chunks).value();
        }
        v.change_summary = column_string(stmt, 6);
        v.author_id = column_string(stmt, 7);
        v.created_at = sqlite3_column_int64(stmt, 8);
        return Result<Version>::ok(std::move(v));
    }

    // Run a prepared single-row version query
    Result<Version> fetch_version(sqlite3_stmt* stmt, const std::string& not_found) {
        ResetOnExit reset{stmt};
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) return read_version(stmt);
        if (rc == SQLITE_DONE) return ScribeError(ScribeError::NotFound, not_found);
        return ScribeError(ScribeError::Storage,
            std::string("version query failed: ") + sqlite3_errmsg(db));
    }

    Status load_scores(BenchmarkResult& r) {
        SCRIBE_TRY(prepare(
            "SELECT dimension, score FROM dimension_scores WHERE result_id=?",
            stmt_scores));
        bind_string(stmt_scores, 1, r.id);
        int rc;
        while ((rc = sqlite3_step(stmt_scores)) == SQLITE_ROW) {
            r.dimension_scores[column_string(stmt_scores, 0)] =
                sqlite3_column_double(stmt_scores, 1);
        }
        if (rc != SQLITE_DONE) {
            return ScribeError(ScribeError::Storage,
                std::string("score query failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    // Drain a benchmark query; dimension scores are loaded afterwards
    // because they reuse a different statement.
    Result<std::vector<BenchmarkResult>> fetch_benchmarks(sqlite3_stmt* stmt) {
        std::vector<BenchmarkResult> out;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            BenchmarkResult r;
            r.id = column_string(stmt, 0);
            r.version_id = column_string(stmt, 1);
            r.artifact_id = column_string(stmt, 2);
            r.suite_id = column_string(stmt, 3);
            r.overall_score = sqlite3_column_double(stmt, 4);
            r.baseline_score = column_optional_double(stmt, 5);
            r.delta = column_optional_double(stmt, 6);
            r.gate_passed = sqlite3_column_int(stmt, 7) != 0;
            r.executed_at = sqlite3_column_int64(stmt, 8);
            out.push_back(std::move(r));
        }
        if (rc != SQLITE_DONE) {
            return ScribeError(ScribeError::Storage,
                std::string("benchmark query failed: ") + sqlite3_errmsg(db));
        }
        for (auto& r : out) {
            SCRIBE_TRY(load_scores(r));
        }
        return Result<std::vector<BenchmarkResult>>::ok(std::move(out));
    }

    Status artifact_exists(const std::string& artifact_id) {
        SCRIBE_TRY(prepare(
            "SELECT id, slug, status, status_version, created_at FROM artifacts WHERE id=?",
            stmt_find_artifact));
        bind_string(stmt_find_artifact, 1, artifact_id);
        ResetOnExit reset{stmt_find_artifact};
        int rc = sqlite3_step(stmt_find_artifact);
        if (rc == SQLITE_ROW) return ok_status();
        if (rc == SQLITE_DONE) {
            return ScribeError(ScribeError::NotFound, "artifact not found: " + artifact_id);
        }
        return ScribeError(ScribeError::Storage,
            std::string("artifact query failed: ") + sqlite3_errmsg(db));
    }
};

// ---------------------------------------------------------------------------
// SqliteRepository public interface
// ---------------------------------------------------------------------------

SqliteRepository::SqliteRepository() : impl_(std::make_unique<Impl>()) {}
SqliteRepository::~SqliteRepository() = default;
SqliteRepository::SqliteRepository(SqliteRepository&&) noexcept = default;
SqliteRepository& SqliteRepository::operator=(SqliteRepository&&) noexcept = default;

std::string SqliteRepository::default_db_path() {
    return scribe_home() + "/scribe.db";
}

Status SqliteRepository::open(const std::string& db_path) {
    close();

    if (db_path != ":memory:") {
        fs::path parent = fs::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return ScribeError(ScribeError::IO,
                    "failed to create database directory: " + parent.string());
            }
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return ScribeError(ScribeError::Storage,
            "failed to open database " + db_path + ": " + err_msg);
    }
    sqlite3_busy_timeout(impl_->db, 5000);
    sqlite3_extended_result_codes(impl_->db, 1);

    auto setup = impl_->exec(
        "PRAGMA journal_mode=WAL;"
        "PRAGMA synchronous=NORMAL;"
        "PRAGMA foreign_keys=ON;");
    if (setup.is_ok()) setup = impl_->init_schema();
    if (setup.is_err()) {
        close();
        return setup;
    }

    scribe::log::debug("opened version database: %s", db_path.c_str());
    return ok_status();
}

void SqliteRepository::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool SqliteRepository::is_open() const {
    return impl_->db != nullptr;
}

// ---------------------------------------------------------------------------
// Artifacts
// ---------------------------------------------------------------------------

Status SqliteRepository::insert_artifact(const Artifact& artifact) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->prepare(
        "INSERT INTO artifacts (id, slug, status, status_version, head_version_id, created_at) "
        "VALUES (?, ?, ?, ?, NULL, ?)",
        impl_->stmt_insert_artifact));

    sqlite3_stmt* s = impl_->stmt_insert_artifact;
    bind_string(s, 1, artifact.id);
    bind_string(s, 2, artifact.slug);
    bind_string(s, 3, artifact_status_name(artifact.status));
    bind_string(s, 4, artifact.status_version);
    sqlite3_bind_int64(s, 5, artifact.created_at);
    return impl_->step_done(s, "insert artifact " + artifact.slug);
}

Result<Artifact> SqliteRepository::find_artifact(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->prepare(
        "SELECT id, slug, status, status_version, created_at FROM artifacts WHERE id=?",
        impl_->stmt_find_artifact));
    bind_string(impl_->stmt_find_artifact, 1, artifact_id);

    ResetOnExit reset{impl_->stmt_find_artifact};
    int rc = sqlite3_step(impl_->stmt_find_artifact);
    if (rc == SQLITE_ROW) return impl_->read_artifact(impl_->stmt_find_artifact);
    if (rc == SQLITE_DONE) {
        return ScribeError(ScribeError::NotFound, "artifact not found: " + artifact_id);
    }
    return ScribeError(ScribeError::Storage,
        std::string("artifact query failed: ") + sqlite3_errmsg(impl_->db));
}

Result<Artifact> SqliteRepository::find_artifact_by_slug(const std::string& slug) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->prepare(
        "SELECT id, slug, status, status_version, created_at FROM artifacts WHERE slug=?",
        impl_->stmt_find_artifact_slug));
    bind_string(impl_->stmt_find_artifact_slug, 1, slug);

    ResetOnExit reset{impl_->stmt_find_artifact_slug};
    int rc = sqlite3_step(impl_->stmt_find_artifact_slug);
    if (rc == SQLITE_ROW) return impl_->read_artifact(impl_->stmt_find_artifact_slug);
    if (rc == SQLITE_DONE) {
        return ScribeError(ScribeError::NotFound, "no artifact with slug: " + slug);
    }
    return ScribeError(ScribeError::Storage,
        std::string("artifact query failed: ") + sqlite3_errmsg(impl_->db));
}

Status SqliteRepository::update_artifact_status(const std::string& artifact_id,
                                                ArtifactStatus status,
                                                const std::string& version_string) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->prepare(
        "UPDATE artifacts SET status=?, status_version=? WHERE id=?",
        impl_->stmt_update_status));
    bind_string(impl_->stmt_update_status, 1, artifact_status_name(status));
    bind_string(impl_->stmt_update_status, 2, version_string);
    bind_string(impl_->stmt_update_status, 3, artifact_id);
    SCRIBE_TRY(impl_->step_done(impl_->stmt_update_status, "update artifact status"));

    if (sqlite3_changes(impl_->db) == 0) {
        return ScribeError(ScribeError::NotFound, "artifact not found: " + artifact_id);
    }
    return ok_status();
}

Status SqliteRepository::delete_artifact(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->prepare("DELETE FROM artifacts WHERE id=?",
                              impl_->stmt_delete_artifact));
    bind_string(impl_->stmt_delete_artifact, 1, artifact_id);
    SCRIBE_TRY(impl_->step_done(impl_->stmt_delete_artifact, "delete artifact"));

    if (sqlite3_changes(impl_->db) == 0) {
        return ScribeError(ScribeError::NotFound, "artifact not found: " + artifact_id);
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Versions
// ---------------------------------------------------------------------------

Result<Version> SqliteRepository::head(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->artifact_exists(artifact_id));
    SCRIBE_TRY(impl_->prepare(
        "SELECT " VERSION_COLUMNS " FROM versions "
        "WHERE id=(SELECT head_version_id FROM artifacts WHERE id=?)",
        impl_->stmt_head));
    bind_string(impl_->stmt_head, 1, artifact_id);
    return impl_->fetch_version(impl_->stmt_head,
        "artifact has no versions: " + artifact_id);
}

Status SqliteRepository::append_version(const Version& version,
                                        const std::string& expected_head_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->require_open());
    SCRIBE_TRY(impl_->exec("BEGIN IMMEDIATE;"));

    auto body = [&]() -> Status {
        // Compare-and-swap on the head pointer
        SCRIBE_TRY(impl_->prepare(
            "UPDATE artifacts SET head_version_id=? WHERE id=? AND head_version_id IS ?",
            impl_->stmt_move_head));
        sqlite3_stmt* mv = impl_->stmt_move_head;
        bind_string(mv, 1, version.id);
        bind_string(mv, 2, version.artifact_id);
        if (expected_head_id.empty()) {
            sqlite3_bind_null(mv, 3);
        } else {
            bind_string(mv, 3, expected_head_id);
        }
        SCRIBE_TRY(impl_->step_done(mv, "move head"));

        if (sqlite3_changes(impl_->db) == 0) {
            SCRIBE_TRY(impl_->artifact_exists(version.artifact_id));
            return ScribeError(ScribeError::VersionConflict,
                "head of " + version.artifact_id + " moved during write",
                "reload the head version and retry");
        }

        SCRIBE_TRY(impl_->prepare(
            "INSERT INTO versions (" VERSION_COLUMNS ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
            impl_->stmt_insert_version));
        sqlite3_stmt* ins = impl_->stmt_insert_version;
        bind_string(ins, 1, version.id);
        bind_string(ins, 2, version.artifact_id);
        bind_string(ins, 3, version.version_string);
        bind_string(ins, 4, version.content);
        bind_string(ins, 5, version.content_hash);
        std::vector<uint8_t> blob;
        if (version.diff_from_parent.has_value()) {
            blob = encode_chunks(*version.diff_from_parent);
            sqlite3_bind_blob(ins, 6, blob.data(), static_cast<int>(blob.size()),
                              SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(ins, 6);
        }
        bind_string(ins, 7, version.change_summary);
        bind_string(ins, 8, version.author_id);
        sqlite3_bind_int64(ins, 9, version.created_at);

        auto inserted = impl_->step_done(ins, "insert version " + version.version_string);
        if (inserted.is_err(ScribeError::Duplicate)) {
            return ScribeError(ScribeError::VersionConflict,
                "version " + version.version_string + " already exists");
        }
        return inserted;
    };

    auto status = body();
    if (status.is_err()) {
        impl_->rollback();
        return status;
    }
    return impl_->exec("COMMIT;");
}

Result<Version> SqliteRepository::find_version(const std::string& artifact_id,
                                               const std::string& version_string) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->artifact_exists(artifact_id));
    SCRIBE_TRY(impl_->prepare(
        "SELECT " VERSION_COLUMNS " FROM versions WHERE artifact_id=? AND version_string=?",
        impl_->stmt_find_version));
    bind_string(impl_->stmt_find_version, 1, artifact_id);
    bind_string(impl_->stmt_find_version, 2, version_string);
    return impl_->fetch_version(impl_->stmt_find_version,
        "version " + version_string + " not found for artifact " + artifact_id);
}

Result<Version> SqliteRepository::find_version_by_id(const std::string& version_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->prepare(
        "SELECT " VERSION_COLUMNS " FROM versions WHERE id=?",
        impl_->stmt_find_version_id));
    bind_string(impl_->stmt_find_version_id, 1, version_id);
    return impl_->fetch_version(impl_->stmt_find_version_id,
        "version not found: " + version_id);
}

Result<std::vector<Version>> SqliteRepository::list_versions(const std::string& artifact_id,
                                                             size_t limit, size_t offset) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->artifact_exists(artifact_id));
    SCRIBE_TRY(impl_->prepare(
        "SELECT " VERSION_COLUMNS " FROM versions WHERE artifact_id=? "
        "ORDER BY seq DESC LIMIT ? OFFSET ?",
        impl_->stmt_list_versions));
    sqlite3_stmt* s = impl_->stmt_list_versions;
    bind_string(s, 1, artifact_id);
    sqlite3_bind_int64(s, 2, static_cast<int64_t>(limit));
    sqlite3_bind_int64(s, 3, static_cast<int64_t>(offset));

    std::vector<Version> out;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        auto v = impl_->read_version(s);
        if (v.is_err()) return std::move(v).error();
        out.push_back(std::move(v).value());
    }
    if (rc != SQLITE_DONE) {
        return ScribeError(ScribeError::Storage,
            std::string("version listing failed: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<Version>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Benchmarks
// ---------------------------------------------------------------------------

Status SqliteRepository::append_benchmark(const BenchmarkResult& result) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->require_open());
    SCRIBE_TRY(impl_->exec("BEGIN IMMEDIATE;"));

    auto body = [&]() -> Status {
        SCRIBE_TRY(impl_->artifact_exists(result.artifact_id));
        SCRIBE_TRY(impl_->prepare(
            "INSERT INTO benchmark_results (" BENCHMARK_COLUMNS ") "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
            impl_->stmt_insert_benchmark));
        sqlite3_stmt* s = impl_->stmt_insert_benchmark;
        bind_string(s, 1, result.id);
        bind_string(s, 2, result.version_id);
        bind_string(s, 3, result.artifact_id);
        bind_string(s, 4, result.suite_id);
        sqlite3_bind_double(s, 5, result.overall_score);
        bind_optional_double(s, 6, result.baseline_score);
        bind_optional_double(s, 7, result.delta);
        sqlite3_bind_int(s, 8, result.gate_passed ? 1 : 0);
        sqlite3_bind_int64(s, 9, result.executed_at);
        SCRIBE_TRY(impl_->step_done(s, "insert benchmark result " + result.id));

        for (const auto& [dimension, score] : result.dimension_scores) {
            SCRIBE_TRY(impl_->prepare(
                "INSERT INTO dimension_scores (result_id, dimension, score) VALUES (?, ?, ?)",
                impl_->stmt_insert_score));
            bind_string(impl_->stmt_insert_score, 1, result.id);
            bind_string(impl_->stmt_insert_score, 2, dimension);
            sqlite3_bind_double(impl_->stmt_insert_score, 3, score);
            SCRIBE_TRY(impl_->step_done(impl_->stmt_insert_score,
                                        "insert dimension score " + dimension));
        }
        return ok_status();
    };

    auto status = body();
    if (status.is_err()) {
        impl_->rollback();
        return status;
    }
    return impl_->exec("COMMIT;");
}

Result<std::vector<BenchmarkResult>> SqliteRepository::benchmark_history(
        const std::string& artifact_id, size_t limit) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->artifact_exists(artifact_id));
    SCRIBE_TRY(impl_->prepare(
        "SELECT " BENCHMARK_COLUMNS " FROM benchmark_results WHERE artifact_id=? "
        "ORDER BY executed_at DESC, seq DESC LIMIT ?",
        impl_->stmt_history));
    bind_string(impl_->stmt_history, 1, artifact_id);
    // LIMIT -1 is unlimited in SQLite
    sqlite3_bind_int64(impl_->stmt_history, 2,
                       limit == 0 ? -1 : static_cast<int64_t>(limit));
    return impl_->fetch_benchmarks(impl_->stmt_history);
}

Result<std::vector<BenchmarkResult>> SqliteRepository::version_benchmarks(
        const std::string& version_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SCRIBE_TRY(impl_->prepare(
        "SELECT " BENCHMARK_COLUMNS " FROM benchmark_results WHERE version_id=? "
        "ORDER BY executed_at DESC, seq DESC",
        impl_->stmt_version_benchmarks));
    bind_string(impl_->stmt_version_benchmarks, 1, version_id);
    auto results = impl_->fetch_benchmarks(impl_->stmt_version_benchmarks);
    if (results.is_err()) return results;

    if (results.value().empty()) {
        SCRIBE_TRY(impl_->prepare(
            "SELECT " VERSION_COLUMNS " FROM versions WHERE id=?",
            impl_->stmt_find_version_id));
        bind_string(impl_->stmt_find_version_id, 1, version_id);
        auto v = impl_->fetch_version(impl_->stmt_find_version_id,
                                      "version not found: " + version_id);
        if (v.is_err()) return std::move(v).error();
    }
    return results;
}

} // namespace scribe
