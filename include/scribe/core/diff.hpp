#pragma once

#include <scribe/result.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace scribe {

enum class ChunkKind {
    Context,
    Add,
    Remove,
};

const char* chunk_kind_name(ChunkKind kind);

// A run of lines of one kind. Starts are 1-based. A side with no lines in
// this chunk reports the number the next line on that side would have.
struct DiffChunk {
    ChunkKind kind = ChunkKind::Context;
    int old_start = 1;
    int old_line_count = 0;
    int new_start = 1;
    int new_line_count = 0;
    std::vector<std::string> lines;

    bool operator==(const DiffChunk& o) const;
    bool operator!=(const DiffChunk& o) const { return !(*this == o); }
};

struct DiffResult {
    std::string from_version;
    std::string to_version;
    std::vector<DiffChunk> chunks;

    bool empty() const { return chunks.empty(); }
    int added_lines() const;
    int removed_lines() const;
};

struct DiffOptions {
    // Either side above this many lines fails with ContentTooLarge
    size_t max_lines = 50000;
};

// Split on '\n' without keeping the separator. Empty text has no lines;
// a trailing '\n' produces a final empty line, so join_lines(split_lines(t)) == t.
std::vector<std::string> split_lines(const std::string& text);
std::string join_lines(const std::vector<std::string>& lines);

// Line-oriented diff. The returned chunks cover both inputs completely
// (context runs are not windowed) in ascending new-content order.
//
// Alignment: common prefix and suffix are matched first, the remainder is
// aligned with Myers' linear-space bisection. Inside each change region all
// removed lines form one Remove chunk, followed by one Add chunk.
class DiffEngine {
public:
    DiffEngine() = default;
    explicit DiffEngine(DiffOptions opts) : opts_(opts) {}

    Result<std::vector<DiffChunk>> diff(const std::string& old_content,
                                        const std::string& new_content) const;

    // Replay chunks over old_content. Fails with Parse when the chunks do
    // not describe old_content.
    static Result<std::string> apply(const std::string& old_content,
                                     const std::vector<DiffChunk>& chunks);

    // Classic unified diff text with `context_lines` of context per hunk
    static std::string render_unified(const DiffResult& result, int context_lines = 3);

    const DiffOptions& options() const { return opts_; }

private:
    DiffOptions opts_;
};

} // namespace scribe
