#include "review_session.hpp"

#include "review/comment_storage.hpp"
#include "processing/diff_parser.hpp"
#include "util/log.hpp"

#include <utility>

using namespace diffreview;

ReviewSession::ReviewSession(DiffSource& source, SessionOptions options)
    : source_(source)
    , options_(options) {
}

bool
ReviewSession::load(const std::string& repo_root) {
    auto acquisition = source_.acquire(repo_root);
    log_debug("acquire '{}': {}", repo_root, to_string(acquisition.status));

    std::vector<DiffFile> files;
    std::vector<DiffComment> comments;
    const bool acquired = acquisition.status == AcquireStatus::kOk || acquisition.status == AcquireStatus::kNoChanges;
    if (acquired) {
        files = parse_diff(acquisition.text);
        comments = load_comments(repo_root);
    }

    repo_root_ = repo_root;
    status_ = acquisition.status;
    message_ = std::move(acquisition.message);
    can_persist_ = acquired;
    files_.swap(files);
    overlay_.replace(std::move(comments));
    rebuild();

    return acquired;
}

void
ReviewSession::set_wrap_width(int64_t columns) {
    if (columns < 0) {
        columns = 0;
    }
    if (columns == options_.projection.wrap_width) {
        return;
    }
    options_.projection.wrap_width = columns;
    rebuild();
}

bool
ReviewSession::toggle_collapsed(size_t file) {
    if (file >= files_.size()) {
        return false;
    }
    return set_collapsed(file, !files_[file].collapsed);
}

bool
ReviewSession::set_collapsed(size_t file, bool collapsed) {
    if (file >= files_.size()) {
        return false;
    }
    if (files_[file].collapsed != collapsed) {
        files_[file].collapsed = collapsed;
        rebuild();
    }
    return true;
}

bool
ReviewSession::add_or_update_comment(size_t row, std::string text) {
    if (!overlay_.add_or_update(files_, rows_, row, std::move(text))) {
        return false;
    }
    update_comment_heights();
    persist();
    return true;
}

bool
ReviewSession::remove_comment(size_t index) {
    if (!overlay_.remove(index)) {
        return false;
    }
    update_comment_heights();
    persist();
    return true;
}

void
ReviewSession::hide() {
    persist();
}

bool
ReviewSession::send_to_agent(AgentSink& sink, const std::string& command) {
    const auto payload = format_comments_for_agent(overlay_.comments());
    if (payload.empty()) {
        log_info("no unsent comments");
        return false;
    }

    if (!sink.deliver(payload, command)) {
        return false;
    }

    log_info("sent {} comments", overlay_.unsent_count());
    overlay_.mark_sent();
    update_comment_heights();
    persist();
    return true;
}

LayoutHit
ReviewSession::hit_test(int64_t y) const {
    return resolve_hit(y, rows_.size(), options_.row_height, comment_height_fn());
}

int64_t
ReviewSession::row_y(size_t row) const {
    return row_to_y(row, rows_.size(), options_.row_height, comment_height_fn());
}

int64_t
ReviewSession::content_height() const {
    return diffreview::content_height(rows_.size(), options_.row_height, comment_height_fn());
}

int64_t
ReviewSession::comment_height(size_t row) const {
    return row < comment_heights_.size() ? comment_heights_[row] : 0;
}

void
ReviewSession::rebuild() {
    if (!message_.empty()) {
        rows_ = {MessageRow{message_}};
    } else {
        rows_ = project_rows(files_, options_.projection);
    }
    overlay_.resolve_positions(files_, rows_);
    update_comment_heights();
}

void
ReviewSession::update_comment_heights() {
    comment_heights_.assign(rows_.size(), 0);
    for (const auto& comment : overlay_.comments()) {
        if (comment.sent || !comment.display_row_index || *comment.display_row_index >= rows_.size()) {
            continue;
        }
        int64_t& height = comment_heights_[*comment.display_row_index];
        if (height == 0) {
            height = comment_box_height(comment.text, options_.projection.wrap_width, options_.projection.tab_width,
                                        options_.comment_box);
        }
    }
}

void
ReviewSession::persist() {
    if (!can_persist_) {
        return;
    }
    if (!save_comments(repo_root_, overlay_.comments())) {
        log_debug("comments kept in memory only");
    }
}

CommentHeightFn
ReviewSession::comment_height_fn() const {
    return [this](size_t row) { return comment_height(row); };
}
