#include <scribe/core/diff.hpp>
#include <algorithm>
#include <unordered_map>

namespace scribe {

const char* chunk_kind_name(ChunkKind kind) {
    switch (kind) {
    case ChunkKind::Context: return "context";
    case ChunkKind::Add:     return "add";
    case ChunkKind::Remove:  return "remove";
    }
    return "?";
}

bool DiffChunk::operator==(const DiffChunk& o) const {
    return kind == o.kind &&
           old_start == o.old_start && old_line_count == o.old_line_count &&
           new_start == o.new_start && new_line_count == o.new_line_count &&
           lines == o.lines;
}

int DiffResult::added_lines() const {
    int n = 0;
    for (const auto& c : chunks) {
        if (c.kind == ChunkKind::Add) n += c.new_line_count;
    }
    return n;
}

int DiffResult::removed_lines() const {
    int n = 0;
    for (const auto& c : chunks) {
        if (c.kind == ChunkKind::Remove) n += c.old_line_count;
    }
    return n;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    if (text.empty()) return lines;

    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

// ---------------------------------------------------------------------------
// Edit script
// ---------------------------------------------------------------------------

namespace {

enum class OpKind { Equal, Delete, Insert };

struct EditOp {
    OpKind kind;
    int old_index;  // valid for Equal and Delete
    int new_index;  // valid for Equal and Insert
};

// Myers diff over interned line ids. Ranges are half-open.
class Aligner {
public:
    Aligner(const std::vector<int>& a, const std::vector<int>& b, size_t num_ids)
        : a_(a), b_(b), seen_(num_ids, 0) {}

    std::vector<EditOp> run() {
        align(0, static_cast<int>(a_.size()), 0, static_cast<int>(b_.size()));
        return std::move(ops_);
    }

private:
    void align(int a_lo, int a_hi, int b_lo, int b_hi) {
        // Common prefix
        while (a_lo < a_hi && b_lo < b_hi && a_[a_lo] == b_[b_lo]) {
            ops_.push_back({OpKind::Equal, a_lo, b_lo});
            ++a_lo;
            ++b_lo;
        }

        // Common suffix, emitted after the middle
        int suffix = 0;
        while (a_hi - suffix > a_lo && b_hi - suffix > b_lo &&
               a_[a_hi - suffix - 1] == b_[b_hi - suffix - 1]) {
            ++suffix;
        }
        a_hi -= suffix;
        b_hi -= suffix;

        if (a_lo == a_hi) {
            for (int j = b_lo; j < b_hi; ++j) ops_.push_back({OpKind::Insert, a_lo, j});
        } else if (b_lo == b_hi) {
            for (int i = a_lo; i < a_hi; ++i) ops_.push_back({OpKind::Delete, i, b_lo});
        } else if (!shares_line(a_lo, a_hi, b_lo, b_hi)) {
            replace_all(a_lo, a_hi, b_lo, b_hi);
        } else {
            bisect(a_lo, a_hi, b_lo, b_hi);
        }

        for (int s = 0; s < suffix; ++s) {
            ops_.push_back({OpKind::Equal, a_hi + s, b_hi + s});
        }
    }

    // Find the middle snake of the D-path and recurse on both halves.
    void bisect(int a_lo, int a_hi, int b_lo, int b_hi) {
        const int n = a_hi - a_lo;
        const int m = b_hi - b_lo;
        const int max_d = (n + m + 1) / 2;
        const int v_offset = max_d;
        const int v_length = 2 * max_d;
        std::vector<int> v1(v_length, -1);
        std::vector<int> v2(v_length, -1);
        v1[v_offset + 1] = 0;
        v2[v_offset + 1] = 0;
        const int delta = n - m;
        const bool front = (delta % 2 != 0);

        int k1_start = 0, k1_end = 0, k2_start = 0, k2_end = 0;
        for (int d = 0; d < max_d; ++d) {
            // Forward path
            for (int k1 = -d + k1_start; k1 <= d - k1_end; k1 += 2) {
                int k1_off = v_offset + k1;
                int x1;
                if (k1 == -d || (k1 != d && v1[k1_off - 1] < v1[k1_off + 1])) {
                    x1 = v1[k1_off + 1];
                } else {
                    x1 = v1[k1_off - 1] + 1;
                }
                int y1 = x1 - k1;
                while (x1 < n && y1 < m && a_[a_lo + x1] == b_[b_lo + y1]) {
                    ++x1;
                    ++y1;
                }
                v1[k1_off] = x1;
                if (x1 > n) {
                    k1_end += 2;
                } else if (y1 > m) {
                    k1_start += 2;
                } else if (front) {
                    int k2_off = v_offset + delta - k1;
                    if (k2_off >= 0 && k2_off < v_length && v2[k2_off] != -1) {
                        int x2 = n - v2[k2_off];
                        if (x1 >= x2) {
                            split(a_lo, a_hi, b_lo, b_hi, x1, y1);
                            return;
                        }
                    }
                }
            }

            // Reverse path
            for (int k2 = -d + k2_start; k2 <= d - k2_end; k2 += 2) {
                int k2_off = v_offset + k2;
                int x2;
                if (k2 == -d || (k2 != d && v2[k2_off - 1] < v2[k2_off + 1])) {
                    x2 = v2[k2_off + 1];
                } else {
                    x2 = v2[k2_off - 1] + 1;
                }
                int y2 = x2 - k2;
                while (x2 < n && y2 < m &&
                       a_[a_hi - x2 - 1] == b_[b_hi - y2 - 1]) {
                    ++x2;
                    ++y2;
                }
                v2[k2_off] = x2;
                if (x2 > n) {
                    k2_end += 2;
                } else if (y2 > m) {
                    k2_start += 2;
                } else if (!front) {
                    int k1_off = v_offset + delta - k2;
                    if (k1_off >= 0 && k1_off < v_length && v1[k1_off] != -1) {
                        int x1 = v1[k1_off];
                        int y1 = v_offset + x1 - k1_off;
                        if (x1 >= n - x2) {
                            split(a_lo, a_hi, b_lo, b_hi, x1, y1);
                            return;
                        }
                    }
                }
            }
        }

        replace_all(a_lo, a_hi, b_lo, b_hi);
    }

    // A full rewrite would otherwise cost the bisection O(n * m)
    bool shares_line(int a_lo, int a_hi, int b_lo, int b_hi) {
        for (int j = b_lo; j < b_hi; ++j) seen_[b_[j]] = 1;
        bool shared = false;
        for (int i = a_lo; i < a_hi && !shared; ++i) shared = seen_[a_[i]] != 0;
        for (int j = b_lo; j < b_hi; ++j) seen_[b_[j]] = 0;
        return shared;
    }

    void replace_all(int a_lo, int a_hi, int b_lo, int b_hi) {
        for (int i = a_lo; i < a_hi; ++i) ops_.push_back({OpKind::Delete, i, b_lo});
        for (int j = b_lo; j < b_hi; ++j) ops_.push_back({OpKind::Insert, a_hi, j});
    }

    void split(int a_lo, int a_hi, int b_lo, int b_hi, int x, int y) {
        align(a_lo, a_lo + x, b_lo, b_lo + y);
        align(a_lo + x, a_hi, b_lo + y, b_hi);
    }

    const std::vector<int>& a_;
    const std::vector<int>& b_;
    std::vector<char> seen_;  // scratch marks indexed by line id
    std::vector<EditOp> ops_;
};

} // namespace

// Group an edit script into context / remove / add chunks
static std::vector<DiffChunk> build_chunks(const std::vector<EditOp>& ops,
                                           const std::vector<std::string>& old_lines,
                                           const std::vector<std::string>& new_lines) {
    std::vector<DiffChunk> chunks;
    int old_pos = 0;  // lines of old consumed
    int new_pos = 0;  // lines of new produced

    size_t i = 0;
    while (i < ops.size()) {
        if (ops[i].kind == OpKind::Equal) {
            DiffChunk c;
            c.kind = ChunkKind::Context;
            c.old_start = old_pos + 1;
            c.new_start = new_pos + 1;
            while (i < ops.size() && ops[i].kind == OpKind::Equal) {
                c.lines.push_back(old_lines[ops[i].old_index]);
                ++old_pos;
                ++new_pos;
                ++i;
            }
            c.old_line_count = static_cast<int>(c.lines.size());
            c.new_line_count = c.old_line_count;
            chunks.push_back(std::move(c));
            continue;
        }

        // Change region: every delete and insert up to the next equal line
        DiffChunk removed;
        removed.kind = ChunkKind::Remove;
        removed.old_start = old_pos + 1;
        removed.new_start = new_pos + 1;
        DiffChunk added;
        added.kind = ChunkKind::Add;
        added.new_start = new_pos + 1;

        while (i < ops.size() && ops[i].kind != OpKind::Equal) {
            if (ops[i].kind == OpKind::Delete) {
                removed.lines.push_back(old_lines[ops[i].old_index]);
            } else {
                added.lines.push_back(new_lines[ops[i].new_index]);
            }
            ++i;
        }

        removed.old_line_count = static_cast<int>(removed.lines.size());
        old_pos += removed.old_line_count;
        added.old_start = old_pos + 1;
        added.new_line_count = static_cast<int>(added.lines.size());
        new_pos += added.new_line_count;

        if (!removed.lines.empty()) chunks.push_back(std::move(removed));
        if (!added.lines.empty()) chunks.push_back(std::move(added));
    }
    return chunks;
}

Result<std::vector<DiffChunk>> DiffEngine::diff(const std::string& old_content,
                                                const std::string& new_content) const {
    if (old_content == new_content) {
        return Result<std::vector<DiffChunk>>::ok({});
    }

    auto old_lines = split_lines(old_content);
    auto new_lines = split_lines(new_content);
    size_t largest = std::max(old_lines.size(), new_lines.size());
    if (largest > opts_.max_lines) {
        return ScribeError{ScribeError::ContentTooLarge,
            "content has " + std::to_string(largest) + " lines, limit is " +
                std::to_string(opts_.max_lines),
            "raise [diff] max_lines or split the artifact"};
    }

    // Intern lines so the aligner compares integers
    std::unordered_map<std::string, int> ids;
    auto intern = [&](const std::vector<std::string>& lines) {
        std::vector<int> out;
        out.reserve(lines.size());
        for (const auto& l : lines) {
            auto it = ids.emplace(l, static_cast<int>(ids.size())).first;
            out.push_back(it->second);
        }
        return out;
    };
    std::vector<int> a = intern(old_lines);
    std::vector<int> b = intern(new_lines);

    Aligner aligner(a, b, ids.size());
    auto ops = aligner.run();
    return Result<std::vector<DiffChunk>>::ok(build_chunks(ops, old_lines, new_lines));
}

Result<std::string> DiffEngine::apply(const std::string& old_content,
                                      const std::vector<DiffChunk>& chunks) {
    if (chunks.empty()) {
        return Result<std::string>::ok(old_content);
    }

    auto old_lines = split_lines(old_content);
    std::vector<std::string> out;
    size_t cursor = 0;

    auto mismatch = [](const DiffChunk& c, const std::string& what) {
        return ScribeError{ScribeError::Parse,
            std::string("diff does not apply: ") + chunk_kind_name(c.kind) +
                " chunk at old line " + std::to_string(c.old_start) + " " + what};
    };

    for (const auto& c : chunks) {
        int expected_old = c.kind == ChunkKind::Add ? 0 : static_cast<int>(c.lines.size());
        int expected_new = c.kind == ChunkKind::Remove ? 0 : static_cast<int>(c.lines.size());
        if (c.old_line_count != expected_old || c.new_line_count != expected_new) {
            return mismatch(c, "has inconsistent line counts");
        }
        if (c.old_start != static_cast<int>(cursor) + 1) {
            return mismatch(c, "is out of order");
        }

        if (c.kind == ChunkKind::Add) {
            out.insert(out.end(), c.lines.begin(), c.lines.end());
            continue;
        }

        if (cursor + c.lines.size() > old_lines.size()) {
            return mismatch(c, "runs past the end of the content");
        }
        for (size_t k = 0; k < c.lines.size(); ++k) {
            if (old_lines[cursor + k] != c.lines[k]) {
                return mismatch(c, "does not match line " + std::to_string(cursor + k + 1));
            }
        }
        if (c.kind == ChunkKind::Context) {
            out.insert(out.end(), c.lines.begin(), c.lines.end());
        }
        cursor += c.lines.size();
    }

    if (cursor != old_lines.size()) {
        return ScribeError{ScribeError::Parse,
            "diff does not apply: " + std::to_string(old_lines.size() - cursor) +
                " trailing line(s) of the old content are not covered"};
    }
    return Result<std::string>::ok(join_lines(out));
}

// ---------------------------------------------------------------------------
// Unified rendering
// ---------------------------------------------------------------------------

namespace {

struct FlatLine {
    char tag;       // ' ', '-', '+'
    const std::string* text;
    int old_before; // old lines preceding this entry
    int new_before; // new lines preceding this entry
};

} // namespace

static std::string hunk_range(int before, int count) {
    // GNU convention: an empty range names the line before it
    int start = count == 0 ? before : before + 1;
    if (count == 1) return std::to_string(start);
    return std::to_string(start) + "," + std::to_string(count);
}

std::string DiffEngine::render_unified(const DiffResult& result, int context_lines) {
    if (result.chunks.empty()) return "";
    if (context_lines < 0) context_lines = 0;

    std::vector<FlatLine> flat;
    int old_pos = 0;
    int new_pos = 0;
    for (const auto& c : result.chunks) {
        for (const auto& line : c.lines) {
            switch (c.kind) {
            case ChunkKind::Context:
                flat.push_back({' ', &line, old_pos++, new_pos++});
                break;
            case ChunkKind::Remove:
                flat.push_back({'-', &line, old_pos++, new_pos});
                break;
            case ChunkKind::Add:
                flat.push_back({'+', &line, old_pos, new_pos++});
                break;
            }
        }
    }

    std::string out;
    out += "--- " + (result.from_version.empty() ? std::string("a") : result.from_version) + "\n";
    out += "+++ " + (result.to_version.empty() ? std::string("b") : result.to_version) + "\n";

    const int total = static_cast<int>(flat.size());
    int i = 0;
    while (i < total) {
        // Next change
        while (i < total && flat[i].tag == ' ') ++i;
        if (i >= total) break;

        int hunk_begin = std::max(0, i - context_lines);
        int last_change = i;
        int j = i + 1;
        while (j < total) {
            if (flat[j].tag != ' ') {
                last_change = j;
            } else if (j - last_change > 2 * context_lines) {
                break;
            }
            ++j;
        }
        int hunk_end = std::min(total, last_change + context_lines + 1);

        int old_count = 0;
        int new_count = 0;
        for (int k = hunk_begin; k < hunk_end; ++k) {
            if (flat[k].tag != '+') ++old_count;
            if (flat[k].tag != '-') ++new_count;
        }

        out += "@@ -" + hunk_range(flat[hunk_begin].old_before, old_count) +
               " +" + hunk_range(flat[hunk_begin].new_before, new_count) + " @@\n";
        for (int k = hunk_begin; k < hunk_end; ++k) {
            out += flat[k].tag;
            out += *flat[k].text;
            out += '\n';
        }
        i = hunk_end;
    }
    return out;
}

} // namespace scribe
