#include "comments.hpp"

#include "output/row_projector.hpp"

using namespace diffreview;

namespace {

// Rows of the first logical line matching `key`; returns the last of them.
std::optional<std::size_t>
find_anchor_row(gsl::span<const DiffFile> files, gsl::span<const DisplayRow> rows, const CommentKey& key) {
    std::optional<std::size_t> anchor;
    const DiffLineRow* anchored_line = nullptr;

    for (std::size_t i = 0; i < rows.size(); i++) {
        const auto* line_row = std::get_if<DiffLineRow>(&rows[i]);
        if (!line_row) {
            if (anchor) {
                break;
            }
            continue;
        }

        if (anchored_line) {
            if (!line_row->same_line(*anchored_line)) {
                break;
            }
            anchor = i;
            continue;
        }

        const DiffLine* line = line_for_row(files, *line_row);
        if (!line || line->anchor_line_number() != key.line_number ||
            files[line_row->file].path != key.file_path) {
            continue;
        }

        anchor = i;
        anchored_line = line_row;
    }

    return anchor;
}

}  // namespace

std::optional<CommentKey>
diffreview::comment_key_for_row(gsl::span<const DiffFile> files,
                                gsl::span<const DisplayRow> rows,
                                std::size_t row) {
    if (row >= rows.size()) {
        return std::nullopt;
    }
    const auto* line_row = std::get_if<DiffLineRow>(&rows[row]);
    if (!line_row) {
        return std::nullopt;
    }
    const DiffLine* line = line_for_row(files, *line_row);
    if (!line) {
        return std::nullopt;
    }
    return CommentKey{files[line_row->file].path, line->anchor_line_number()};
}

bool
CommentOverlay::add_or_update(gsl::span<const DiffFile> files,
                              gsl::span<const DisplayRow> rows,
                              std::size_t target_row,
                              std::string text) {
    if (text.empty()) {
        return false;
    }

    const std::size_t anchor_row = final_wrap_row(rows, target_row);
    auto key = comment_key_for_row(files, rows, anchor_row);
    if (!key) {
        return false;
    }

    if (auto existing = find_live(*key); existing) {
        DiffComment& comment = comments_[*existing];
        comment.text = std::move(text);
        comment.display_row_index = anchor_row;
        return true;
    }

    DiffComment comment;
    comment.key = std::move(*key);
    comment.text = std::move(text);
    comment.display_row_index = anchor_row;
    comments_.push_back(std::move(comment));
    return true;
}

bool
CommentOverlay::remove(std::size_t index) {
    if (index >= comments_.size()) {
        return false;
    }
    comments_.erase(comments_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

void
CommentOverlay::resolve_positions(gsl::span<const DiffFile> files, gsl::span<const DisplayRow> rows) {
    for (auto& comment : comments_) {
        if (comment.sent) {
            comment.display_row_index = std::nullopt;
            continue;
        }
        comment.display_row_index = find_anchor_row(files, rows, comment.key);
    }
}

void
CommentOverlay::mark_sent() {
    for (auto& comment : comments_) {
        comment.sent = true;
        comment.display_row_index = std::nullopt;
    }
}

void
CommentOverlay::replace(std::vector<DiffComment> comments) {
    comments_ = std::move(comments);
}

std::optional<std::size_t>
CommentOverlay::comment_at_row(std::size_t row) const {
    for (std::size_t i = 0; i < comments_.size(); i++) {
        const auto& comment = comments_[i];
        if (!comment.sent && comment.display_row_index == row) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t>
CommentOverlay::find_live(const CommentKey& key) const {
    for (std::size_t i = 0; i < comments_.size(); i++) {
        if (!comments_[i].sent && comments_[i].key == key) {
            return i;
        }
    }
    return std::nullopt;
}

std::size_t
CommentOverlay::unsent_count() const {
    std::size_t count = 0;
    for (const auto& comment : comments_) {
        if (!comment.sent) {
            count++;
        }
    }
    return count;
}
