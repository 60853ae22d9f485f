#include "row_layout.hpp"

#include "output/row_projector.hpp"
#include "util/readlines.hpp"

#include <algorithm>

using namespace diffreview;

namespace {

int64_t
box_height(const CommentHeightFn& comment_height, size_t row) {
    return comment_height ? std::max<int64_t>(0, comment_height(row)) : 0;
}

}  // namespace

LayoutHit
diffreview::resolve_hit(int64_t y, size_t row_count, int64_t row_height, const CommentHeightFn& comment_height) {
    if (y < 0) {
        return {};
    }

    int64_t top = 0;
    for (size_t row = 0; row < row_count; row++) {
        if (y < top + row_height) {
            return {HitKind::Row, row};
        }
        top += row_height;

        const int64_t box = box_height(comment_height, row);
        if (y < top + box) {
            return {HitKind::CommentBox, row};
        }
        top += box;
    }
    return {};
}

int64_t
diffreview::row_to_y(size_t row, size_t row_count, int64_t row_height, const CommentHeightFn& comment_height) {
    int64_t y = 0;
    for (size_t i = 0; i < std::min(row, row_count); i++) {
        y += row_height + box_height(comment_height, i);
    }
    return y;
}

int64_t
diffreview::content_height(size_t row_count, int64_t row_height, const CommentHeightFn& comment_height) {
    return row_to_y(row_count, row_count, row_height, comment_height);
}

int64_t
diffreview::comment_box_height(std::string_view text,
                               int64_t text_columns,
                               int64_t tab_width,
                               const CommentBoxMetrics& metrics) {
    int64_t lines = 0;
    for (auto line : splitlines(text)) {
        lines += static_cast<int64_t>(wrap_line_offsets(line, text_columns, tab_width).size());
    }
    if (!text.empty() && text.back() == '\n') {
        lines++;
    }
    lines = std::max<int64_t>(lines, 1);

    // padding, text, padding, buttons, padding
    return lines * metrics.line_height + metrics.button_height + 3 * metrics.padding;
}

CommentBoxLayout
diffreview::comment_box_layout(const Rect& box, const CommentBoxMetrics& metrics) {
    const int64_t pad = metrics.padding;
    const int64_t button_y = box.y + box.height - pad - metrics.button_height;

    CommentBoxLayout layout;
    layout.text_area = Rect{box.x + pad, box.y + pad, std::max<int64_t>(0, box.width - 2 * pad),
                            std::max<int64_t>(0, box.height - 3 * pad - metrics.button_height)};

    layout.submit = Rect{box.x + box.width - pad - metrics.button_width, button_y, metrics.button_width,
                         metrics.button_height};
    layout.cancel = Rect{layout.submit.x - pad - metrics.button_width, button_y, metrics.button_width,
                         metrics.button_height};
    layout.remove = Rect{box.x + pad, button_y, metrics.button_width, metrics.button_height};
    return layout;
}

int64_t
diffreview::scroll_to_reveal(int64_t scroll,
                             int64_t viewport_height,
                             size_t row,
                             size_t row_count,
                             int64_t row_height,
                             const CommentHeightFn& comment_height) {
    if (row >= row_count) {
        return scroll;
    }

    const int64_t top = row_to_y(row, row_count, row_height, comment_height);
    const int64_t bottom = top + row_height + box_height(comment_height, row);

    if (top < scroll) {
        return top;
    }
    if (bottom > scroll + viewport_height) {
        return std::min(top, bottom - viewport_height);
    }
    return scroll;
}
