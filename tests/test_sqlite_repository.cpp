#include <catch2/catch.hpp>
#include <scribe/core/sqlite_repository.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace scribe;

static std::string test_db_path() {
    static int counter = 0;
    return "/tmp/scribe_test_repo_" + std::to_string(getpid())
           + "_" + std::to_string(counter++) + ".db";
}

static void remove_db(const std::string& path) {
    fs::remove(path);
    fs::remove(path + "-wal");
    fs::remove(path + "-shm");
}

static Artifact make_artifact(const std::string& id, const std::string& slug) {
    Artifact a;
    a.id = id;
    a.slug = slug;
    a.created_at = 1000;
    return a;
}

static Version make_version(const std::string& id, const std::string& ver,
                            const std::string& content) {
    Version v;
    v.id = id;
    v.artifact_id = "a1";
    v.version_string = ver;
    v.content = content;
    v.content_hash = "hash-" + ver;
    v.author_id = "alice";
    v.created_at = 2000;
    return v;
}

// ===== Chunk encoding =====

TEST_CASE("encode_chunks / decode_chunks roundtrip", "[sqlite_repository]") {
    DiffEngine engine;
    auto chunks = engine.diff("a\nb\nc\n", "a\nx\nc\ny\n").value();
    auto blob = encode_chunks(chunks);
    auto decoded = decode_chunks(blob.data(), blob.size());
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.value() == chunks);
}

TEST_CASE("decode_chunks rejects damaged blobs", "[sqlite_repository]") {
    DiffEngine engine;
    auto blob = encode_chunks(engine.diff("a\nb", "a\nc").value());

    SECTION("bad magic") {
        auto damaged = blob;
        damaged[0] = 'X';
        auto r = decode_chunks(damaged.data(), damaged.size());
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == ScribeError::Checksum);
    }
    SECTION("truncated") {
        auto r = decode_chunks(blob.data(), blob.size() - 2);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == ScribeError::Storage);
    }
}

// ===== Lifecycle =====

TEST_CASE("SqliteRepository open creates database file", "[sqlite_repository]") {
    auto path = test_db_path();
    SqliteRepository repo;
    REQUIRE(repo.open(path).is_ok());
    REQUIRE(repo.is_open());
    REQUIRE(fs::exists(path));
    repo.close();
    REQUIRE_FALSE(repo.is_open());
    remove_db(path);
}

TEST_CASE("SqliteRepository calls fail when not open", "[sqlite_repository]") {
    SqliteRepository repo;
    auto r = repo.find_artifact("a1");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Storage);
}

TEST_CASE("SqliteRepository refuses an unknown schema version", "[sqlite_repository]") {
    auto path = test_db_path();
    {
        SqliteRepository repo;
        REQUIRE(repo.open(path).is_ok());
    }
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    REQUIRE(sqlite3_exec(db, "UPDATE schema_info SET value='99' WHERE key='version'",
                         nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    SqliteRepository repo;
    auto s = repo.open(path);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == ScribeError::Storage);
    REQUIRE_FALSE(repo.is_open());
    remove_db(path);
}

// ===== Artifacts and versions =====

TEST_CASE("SqliteRepository artifacts", "[sqlite_repository]") {
    SqliteRepository repo;
    REQUIRE(repo.open(":memory:").is_ok());

    REQUIRE(repo.insert_artifact(make_artifact("a1", "greeting")).is_ok());
    REQUIRE(repo.insert_artifact(make_artifact("a2", "greeting")).error().code ==
            ScribeError::Duplicate);

    auto a = repo.find_artifact_by_slug("greeting");
    REQUIRE(a.is_ok());
    REQUIRE(a.value().id == "a1");
    REQUIRE(a.value().status == ArtifactStatus::Draft);
    REQUIRE(a.value().created_at == 1000);

    REQUIRE(repo.update_artifact_status("a1", ArtifactStatus::Deployed, "1.0.0").is_ok());
    REQUIRE(repo.find_artifact("a1").value().status == ArtifactStatus::Deployed);
    REQUIRE(repo.find_artifact("a1").value().status_version == "1.0.0");
    REQUIRE(repo.update_artifact_status("zz", ArtifactStatus::Review, "1.0.0").error().code ==
            ScribeError::NotFound);
}

TEST_CASE("SqliteRepository versions persist across reopen", "[sqlite_repository]") {
    auto path = test_db_path();
    DiffEngine engine;
    auto chunks = engine.diff("A", "A\nB").value();
    {
        SqliteRepository repo;
        REQUIRE(repo.open(path).is_ok());
        REQUIRE(repo.insert_artifact(make_artifact("a1", "greeting")).is_ok());
        REQUIRE(repo.head("a1").error().code == ScribeError::NotFound);

        REQUIRE(repo.append_version(make_version("v1", "1.0.0", "A"), "").is_ok());
        auto v2 = make_version("v2", "1.0.1", "A\nB");
        v2.diff_from_parent = chunks;
        v2.change_summary = "add B";
        REQUIRE(repo.append_version(v2, "v1").is_ok());
    }

    SqliteRepository repo;
    REQUIRE(repo.open(path).is_ok());
    auto head = repo.head("a1");
    REQUIRE(head.is_ok());
    REQUIRE(head.value().id == "v2");
    REQUIRE(head.value().content == "A\nB");
    REQUIRE(head.value().change_summary == "add B");
    REQUIRE(head.value().diff_from_parent.has_value());
    REQUIRE(*head.value().diff_from_parent == chunks);

    auto first = repo.find_version("a1", "1.0.0");
    REQUIRE(first.is_ok());
    REQUIRE_FALSE(first.value().diff_from_parent.has_value());
    REQUIRE(repo.find_version_by_id("v1").value().author_id == "alice");

    auto listed = repo.list_versions("a1", 10, 0).value();
    REQUIRE(listed.size() == 2);
    REQUIRE(listed[0].id == "v2");
    REQUIRE(repo.list_versions("a1", 1, 1).value()[0].id == "v1");
    repo.close();
    remove_db(path);
}

TEST_CASE("SqliteRepository head CAS across connections", "[sqlite_repository]") {
    auto path = test_db_path();
    SqliteRepository writer_a;
    SqliteRepository writer_b;
    REQUIRE(writer_a.open(path).is_ok());
    REQUIRE(writer_b.open(path).is_ok());
    REQUIRE(writer_a.insert_artifact(make_artifact("a1", "greeting")).is_ok());

    // Both read an empty head, A wins the race
    REQUIRE(writer_a.append_version(make_version("va", "1.0.0", "from a"), "").is_ok());
    auto lost = writer_b.append_version(make_version("vb", "1.0.0", "from b"), "");
    REQUIRE(lost.is_err());
    REQUIRE(lost.error().code == ScribeError::VersionConflict);

    // Retrying from the new head succeeds
    REQUIRE(writer_b.append_version(make_version("vb", "1.0.1", "from b"), "va").is_ok());
    REQUIRE(writer_a.head("a1").value().id == "vb");

    // Same version string under the right head is still a conflict
    auto dup = writer_a.append_version(make_version("vc", "1.0.1", "again"), "vb");
    REQUIRE(dup.error().code == ScribeError::VersionConflict);
    REQUIRE(writer_a.head("a1").value().id == "vb");

    auto missing = writer_a.append_version(
        [] { auto v = make_version("vx", "1.0.0", "x"); v.artifact_id = "zz"; return v; }(), "");
    REQUIRE(missing.error().code == ScribeError::NotFound);

    writer_a.close();
    writer_b.close();
    remove_db(path);
}

// ===== Benchmarks =====

TEST_CASE("SqliteRepository benchmark results", "[sqlite_repository]") {
    SqliteRepository repo;
    REQUIRE(repo.open(":memory:").is_ok());
    repo.insert_artifact(make_artifact("a1", "greeting"));
    repo.append_version(make_version("v1", "1.0.0", "A"), "");

    BenchmarkResult r1;
    r1.id = "r1";
    r1.version_id = "v1";
    r1.artifact_id = "a1";
    r1.suite_id = "smoke";
    r1.dimension_scores = {{"clarity", 90.0}, {"safety", 70.0}};
    r1.overall_score = 80.0;
    r1.gate_passed = true;
    r1.executed_at = 100;
    REQUIRE(repo.append_benchmark(r1).is_ok());

    BenchmarkResult r2 = r1;
    r2.id = "r2";
    r2.overall_score = 85.0;
    r2.baseline_score = 80.0;
    r2.delta = 5.0;
    r2.executed_at = 200;
    REQUIRE(repo.append_benchmark(r2).is_ok());

    auto hist = repo.benchmark_history("a1", 0).value();
    REQUIRE(hist.size() == 2);
    REQUIRE(hist[0].id == "r2");
    REQUIRE(hist[0].delta.value() == Approx(5.0));
    REQUIRE(hist[1].id == "r1");
    REQUIRE_FALSE(hist[1].baseline_score.has_value());
    REQUIRE_FALSE(hist[1].delta.has_value());
    REQUIRE(hist[1].dimension_scores.size() == 2);
    REQUIRE(hist[1].dimension_scores.at("safety") == Approx(70.0));
    REQUIRE(hist[1].gate_passed);

    REQUIRE(repo.benchmark_history("a1", 1).value().size() == 1);
    REQUIRE(repo.version_benchmarks("v1").value().front().id == "r2");
    REQUIRE(repo.version_benchmarks("nope").error().code == ScribeError::NotFound);
    REQUIRE(repo.append_benchmark(r1).error().code == ScribeError::Duplicate);
}

TEST_CASE("SqliteRepository delete cascades", "[sqlite_repository]") {
    SqliteRepository repo;
    REQUIRE(repo.open(":memory:").is_ok());
    repo.insert_artifact(make_artifact("a1", "greeting"));
    repo.append_version(make_version("v1", "1.0.0", "A"), "");

    BenchmarkResult r;
    r.id = "r1";
    r.version_id = "v1";
    r.artifact_id = "a1";
    r.suite_id = "smoke";
    r.dimension_scores = {{"clarity", 90.0}};
    r.overall_score = 90.0;
    r.executed_at = 100;
    REQUIRE(repo.append_benchmark(r).is_ok());

    REQUIRE(repo.delete_artifact("a1").is_ok());
    REQUIRE(repo.find_artifact("a1").error().code == ScribeError::NotFound);
    REQUIRE(repo.find_version_by_id("v1").error().code == ScribeError::NotFound);
    REQUIRE(repo.delete_artifact("a1").error().code == ScribeError::NotFound);

    // The slug and ids can be reused
    REQUIRE(repo.insert_artifact(make_artifact("a1", "greeting")).is_ok());
    REQUIRE(repo.append_version(make_version("v1", "1.0.0", "A"), "").is_ok());
    REQUIRE(repo.append_benchmark(r).is_ok());
}
