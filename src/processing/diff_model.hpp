#pragma once

/*
    In-memory model of a unified diff: files, their hunks and the hunk lines.

    The model is rebuilt from scratch on every load and never patched in place.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace diffreview {

using std::int64_t;
using std::size_t;

enum class LineKind {
    Context,
    Add,
    Remove,
};

// A single line of a hunk. `text` is the raw content without the one byte diff prefix.
// An Add line only has a new line number, a Remove line only an old one, and Context
// lines have both.
struct DiffLine {
    LineKind kind = LineKind::Context;
    std::string text;

    std::optional<int64_t> old_line_number;
    std::optional<int64_t> new_line_number;

    // The number comments on this line are keyed by.
    int64_t
    anchor_line_number() const {
        if (kind == LineKind::Remove) {
            return old_line_number.value_or(0);
        }
        return new_line_number.value_or(0);
    }
};

struct DiffHunk {
    std::string header;

    int64_t old_start = 0;
    int64_t old_count = 0;
    int64_t new_start = 0;
    int64_t new_count = 0;

    std::vector<DiffLine> lines;
};

struct DiffFile {
    std::string path;
    bool collapsed = false;

    std::vector<DiffHunk> hunks;
};

}  // namespace diffreview
