#pragma once

/*
    One open review of a repository: the parsed diff, its display rows and the
    comments anchored to them.

    Every change that affects the rows goes through rebuild(), which projects the
    files and then re-anchors the comments, so the rows and comment positions seen
    from outside always agree. Comment changes are written to disk right away.
*/

#include "output/display_row.hpp"
#include "output/row_layout.hpp"
#include "output/row_projector.hpp"
#include "processing/acquire.hpp"
#include "processing/diff_model.hpp"
#include "review/agent.hpp"
#include "review/comments.hpp"

#include <string>
#include <vector>

namespace diffreview {

struct SessionOptions {
    ProjectionOptions projection;
    CommentBoxMetrics comment_box;
    int64_t row_height = 22;
};

class ReviewSession {
   public:
    ReviewSession(DiffSource& source, SessionOptions options);

    // Acquire and parse the diff of `repo_root` and load its saved comments. On failure
    // the rows hold a single message row. Returns true when a diff was acquired, even
    // an empty one.
    bool
    load(const std::string& repo_root);

    // 0 disables wrapping.
    void
    set_wrap_width(int64_t columns);

    bool
    toggle_collapsed(size_t file);

    bool
    set_collapsed(size_t file, bool collapsed);

    bool
    add_or_update_comment(size_t row, std::string text);

    bool
    remove_comment(size_t index);

    // Closing the review; saves the comments one last time.
    void
    hide();

    // Deliver all unsent comments. They are only marked sent when `sink` accepts them.
    bool
    send_to_agent(AgentSink& sink, const std::string& command);

    LayoutHit
    hit_test(int64_t y) const;

    int64_t
    row_y(size_t row) const;

    int64_t
    content_height() const;

    int64_t
    comment_height(size_t row) const;

    const std::vector<DiffFile>&
    files() const {
        return files_;
    }

    const std::vector<DisplayRow>&
    rows() const {
        return rows_;
    }

    const CommentOverlay&
    comments() const {
        return overlay_;
    }

    AcquireStatus
    status() const {
        return status_;
    }

    const std::string&
    repo_root() const {
        return repo_root_;
    }

    const SessionOptions&
    options() const {
        return options_;
    }

   private:
    void
    rebuild();

    void
    persist();

    // One pass over the comments; keeps hit-testing linear in the row count.
    void
    update_comment_heights();

    CommentHeightFn
    comment_height_fn() const;

    DiffSource& source_;
    SessionOptions options_;

    std::string repo_root_;
    AcquireStatus status_ = AcquireStatus::kNoChanges;
    std::string message_;
    bool can_persist_ = false;

    std::vector<DiffFile> files_;
    std::vector<DisplayRow> rows_;
    CommentOverlay overlay_;

    // Height of the comment box under each row, 0 where there is none.
    std::vector<int64_t> comment_heights_;
};

}  // namespace diffreview
