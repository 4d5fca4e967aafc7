#include <catch2/catch.hpp>
#include <scribe/core/diff.hpp>
#include <random>

using namespace scribe;

static DiffChunk chunk(ChunkKind kind, int old_start, int old_count,
                       int new_start, int new_count, std::vector<std::string> lines) {
    DiffChunk c;
    c.kind = kind;
    c.old_start = old_start;
    c.old_line_count = old_count;
    c.new_start = new_start;
    c.new_line_count = new_count;
    c.lines = std::move(lines);
    return c;
}

// ===== Line splitting =====

TEST_CASE("split_lines conventions", "[diff]") {
    REQUIRE(split_lines("").empty());
    REQUIRE(split_lines("A") == std::vector<std::string>{"A"});
    REQUIRE(split_lines("A\nB") == std::vector<std::string>{"A", "B"});
    REQUIRE(split_lines("A\n") == std::vector<std::string>{"A", ""});
    REQUIRE(split_lines("\n") == std::vector<std::string>{"", ""});
}

TEST_CASE("join_lines inverts split_lines", "[diff]") {
    for (const char* text : {"", "A", "A\nB", "A\n", "\n", "\n\nx\n\n"}) {
        INFO(text);
        REQUIRE(join_lines(split_lines(text)) == text);
    }
}

// ===== Diff shapes =====

TEST_CASE("identical inputs give no chunks", "[diff]") {
    DiffEngine engine;
    REQUIRE(engine.diff("", "").value().empty());
    REQUIRE(engine.diff("A\nB\nC", "A\nB\nC").value().empty());
}

TEST_CASE("empty to non-empty is one add chunk", "[diff]") {
    DiffEngine engine;
    auto r = engine.diff("", "A\nB");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0] == chunk(ChunkKind::Add, 1, 0, 1, 2, {"A", "B"}));
}

TEST_CASE("non-empty to empty is one remove chunk", "[diff]") {
    DiffEngine engine;
    auto r = engine.diff("A\nB", "");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0] == chunk(ChunkKind::Remove, 1, 2, 1, 0, {"A", "B"}));
}

TEST_CASE("appending a line is context plus add", "[diff]") {
    DiffEngine engine;
    auto r = engine.diff("A", "A\nB");
    REQUIRE(r.is_ok());
    auto& chunks = r.value();
    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[0] == chunk(ChunkKind::Context, 1, 1, 1, 1, {"A"}));
    REQUIRE(chunks[1] == chunk(ChunkKind::Add, 2, 0, 2, 1, {"B"}));
}

TEST_CASE("replaced line is remove followed by add", "[diff]") {
    DiffEngine engine;
    auto r = engine.diff("a\nb\nc", "a\nx\nc");
    REQUIRE(r.is_ok());
    auto& chunks = r.value();
    REQUIRE(chunks.size() == 4);
    REQUIRE(chunks[0] == chunk(ChunkKind::Context, 1, 1, 1, 1, {"a"}));
    REQUIRE(chunks[1] == chunk(ChunkKind::Remove, 2, 1, 2, 0, {"b"}));
    REQUIRE(chunks[2] == chunk(ChunkKind::Add, 3, 0, 2, 1, {"x"}));
    REQUIRE(chunks[3] == chunk(ChunkKind::Context, 3, 1, 3, 1, {"c"}));
}

TEST_CASE("change region groups all removals before additions", "[diff]") {
    DiffEngine engine;
    auto r = engine.diff("keep\nold1\nold2\nend", "keep\nnew1\nnew2\nnew3\nend");
    REQUIRE(r.is_ok());
    auto& chunks = r.value();
    REQUIRE(chunks.size() == 4);
    REQUIRE(chunks[1].kind == ChunkKind::Remove);
    REQUIRE(chunks[1].lines == std::vector<std::string>{"old1", "old2"});
    REQUIRE(chunks[2].kind == ChunkKind::Add);
    REQUIRE(chunks[2].lines == std::vector<std::string>{"new1", "new2", "new3"});
    REQUIRE(chunks[3] == chunk(ChunkKind::Context, 4, 1, 5, 1, {"end"}));
}

TEST_CASE("trailing newline is a line of its own", "[diff]") {
    DiffEngine engine;
    auto r = engine.diff("A", "A\n");
    REQUIRE(r.is_ok());
    auto& chunks = r.value();
    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[1] == chunk(ChunkKind::Add, 2, 0, 2, 1, {""}));
}

TEST_CASE("chunks ascend in new-content order and tile both sides", "[diff]") {
    DiffEngine engine;
    auto r = engine.diff("1\n2\n3\n4\n5\n6\n7\n8", "0\n1\n3\n4\nx\n6\n7\n8\n9");
    REQUIRE(r.is_ok());

    int old_next = 1;
    int new_next = 1;
    for (const auto& c : r.value()) {
        REQUIRE(c.old_start == old_next);
        REQUIRE(c.new_start == new_next);
        REQUIRE_FALSE(c.lines.empty());
        old_next += c.old_line_count;
        new_next += c.new_line_count;
    }
    REQUIRE(old_next == 9);
    REQUIRE(new_next == 10);
}

TEST_CASE("content over the line limit is rejected", "[diff]") {
    DiffOptions opts;
    opts.max_lines = 3;
    DiffEngine engine(opts);

    REQUIRE(engine.diff("a\nb\nc", "a\nb").is_ok());
    auto r = engine.diff("a\nb\nc", "a\nb\nc\nd");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::ContentTooLarge);
}

// ===== Apply =====

TEST_CASE("apply reconstructs new content", "[diff]") {
    DiffEngine engine;
    std::string old_text = "You are a helpful assistant.\nBe concise.\n";
    std::string new_text = "You are a careful assistant.\nBe concise.\nCite sources.\n";
    auto chunks = engine.diff(old_text, new_text).value();
    auto rebuilt = DiffEngine::apply(old_text, chunks);
    REQUIRE(rebuilt.is_ok());
    REQUIRE(rebuilt.value() == new_text);
}

TEST_CASE("apply with no chunks returns old content", "[diff]") {
    REQUIRE(DiffEngine::apply("same", {}).value() == "same");
}

TEST_CASE("apply rejects chunks for different content", "[diff]") {
    DiffEngine engine;
    auto chunks = engine.diff("a\nb\nc", "a\nx\nc").value();

    auto r = DiffEngine::apply("a\nB\nc", chunks);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Parse);

    auto short_old = DiffEngine::apply("a", chunks);
    REQUIRE(short_old.is_err());
    REQUIRE(short_old.error().code == ScribeError::Parse);

    auto long_old = DiffEngine::apply("a\nb\nc\nd", chunks);
    REQUIRE(long_old.is_err());
    REQUIRE(long_old.error().code == ScribeError::Parse);
}

TEST_CASE("apply rejects inconsistent counts", "[diff]") {
    std::vector<DiffChunk> chunks{chunk(ChunkKind::Add, 1, 0, 1, 2, {"only one"})};
    auto r = DiffEngine::apply("", chunks);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Parse);
}

TEST_CASE("diff then apply round-trips random edits", "[diff]") {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> len_dist(0, 12);
    std::uniform_int_distribution<int> word_dist(0, 5);
    std::uniform_int_distribution<int> coin(0, 1);

    auto random_text = [&]() {
        std::vector<std::string> lines(len_dist(rng));
        for (auto& l : lines) {
            int w = word_dist(rng);
            l = w == 0 ? "" : "line" + std::to_string(w);
        }
        std::string text = join_lines(lines);
        if (coin(rng) && !text.empty()) text += '\n';
        return text;
    };

    DiffEngine engine;
    for (int iter = 0; iter < 300; ++iter) {
        std::string a = random_text();
        std::string b = random_text();
        auto chunks = engine.diff(a, b);
        REQUIRE(chunks.is_ok());
        REQUIRE(chunks.value().empty() == (a == b));

        auto rebuilt = DiffEngine::apply(a, chunks.value());
        INFO("old: " << a << "\nnew: " << b);
        REQUIRE(rebuilt.is_ok());
        REQUIRE(rebuilt.value() == b);

        for (const auto& c : chunks.value()) {
            if (c.kind == ChunkKind::Add) REQUIRE(c.old_line_count == 0);
            if (c.kind == ChunkKind::Remove) REQUIRE(c.new_line_count == 0);
        }
    }
}

// ===== Unified rendering =====

TEST_CASE("render_unified single hunk", "[diff]") {
    DiffEngine engine;
    DiffResult result;
    result.from_version = "1.0.0";
    result.to_version = "1.0.1";
    result.chunks = engine.diff("a\nb\nc", "a\nx\nc").value();

    REQUIRE(DiffEngine::render_unified(result) ==
        "--- 1.0.0\n"
        "+++ 1.0.1\n"
        "@@ -1,3 +1,3 @@\n"
        " a\n"
        "-b\n"
        "+x\n"
        " c\n");
    REQUIRE(result.added_lines() == 1);
    REQUIRE(result.removed_lines() == 1);
}

TEST_CASE("render_unified splits distant changes into hunks", "[diff]") {
    DiffEngine engine;
    DiffResult result;
    result.chunks = engine.diff("1\n2\n3\n4\n5\n6\n7\n8\n9\n10",
                                "1\ntwo\n3\n4\n5\n6\n7\n8\nnine\n10").value();

    auto text = DiffEngine::render_unified(result, 1);
    REQUIRE(text.find("--- a\n+++ b\n") == 0);
    REQUIRE(text.find("@@ -1,3 +1,3 @@\n 1\n-2\n+two\n 3\n") != std::string::npos);
    REQUIRE(text.find("@@ -8,3 +8,3 @@\n 8\n-9\n+nine\n 10\n") != std::string::npos);
    REQUIRE(text.find(" 5\n") == std::string::npos);
}

TEST_CASE("render_unified of no changes is empty", "[diff]") {
    DiffResult result;
    REQUIRE(DiffEngine::render_unified(result).empty());
}
