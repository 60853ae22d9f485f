#pragma once

/*
    Review comments attached to diff lines.

    A comment is keyed by (file path, line number), using the new-side number for
    added and context lines and the old-side number for removed lines. When several
    lines carry the same key, the first one in row order gets the comment. The row a
    comment is drawn under is not part of its identity; it is looked up again after
    every projection rebuild, and always lands on the last wrap row of its line.
*/

#include "output/display_row.hpp"
#include "processing/diff_model.hpp"

#include <gsl/span>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace diffreview {

struct CommentKey {
    std::string file_path;
    int64_t line_number = 0;

    bool
    operator==(const CommentKey& other) const {
        return line_number == other.line_number && file_path == other.file_path;
    }

    bool
    operator!=(const CommentKey& other) const {
        return !(*this == other);
    }
};

struct DiffComment {
    CommentKey key;
    std::string text;

    // Delivered comments are frozen: never anchored, saved or matched again.
    bool sent = false;

    // Row the comment is drawn under in the current projection; not persisted.
    std::optional<std::size_t> display_row_index;
};

// Key of the logical line shown at `row`, or nullopt for rows that are not diff lines.
std::optional<CommentKey>
comment_key_for_row(gsl::span<const DiffFile> files, gsl::span<const DisplayRow> rows, std::size_t row);

class CommentOverlay {
   public:
    CommentOverlay() = default;

    // Attach `text` to the logical line shown at `target_row`. Updates the live comment
    // with the same key if there is one. Returns false for rows that can't carry a
    // comment and for empty text.
    bool
    add_or_update(gsl::span<const DiffFile> files,
                  gsl::span<const DisplayRow> rows,
                  std::size_t target_row,
                  std::string text);

    bool
    remove(std::size_t index);

    // Re-anchor every live comment against a freshly projected row list.
    void
    resolve_positions(gsl::span<const DiffFile> files, gsl::span<const DisplayRow> rows);

    void
    mark_sent();

    // Drop everything and take `comments` as the new set, e.g. after loading from disk.
    void
    replace(std::vector<DiffComment> comments);

    // Index of the live comment anchored at `row`.
    std::optional<std::size_t>
    comment_at_row(std::size_t row) const;

    std::optional<std::size_t>
    find_live(const CommentKey& key) const;

    std::size_t
    unsent_count() const;

    const std::vector<DiffComment>&
    comments() const {
        return comments_;
    }

   private:
    std::vector<DiffComment> comments_;
};

}  // namespace diffreview
