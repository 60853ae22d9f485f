#pragma once

/*
    Vertical layout of the projected rows in pixels.

    Every row is `row_height` tall and may be followed by the box of the comment
    anchored to it:

        y = 0     +--------------------------+
                  | row 0                    |
                  +--------------------------+
                  | row 1                    |
                  +--------------------------+
                  | comment box of row 1     |  comment_height(1)
                  +--------------------------+
                  | row 2                    |
                  ...

    Everything here is a linear walk over the rows; the row list is only rebuilt on
    structural changes, so nothing is cached.
*/

#include <cstdint>
#include <functional>
#include <string_view>

namespace diffreview {

using std::int64_t;
using std::size_t;

struct Rect {
    int64_t x = 0;
    int64_t y = 0;
    int64_t width = 0;
    int64_t height = 0;

    bool
    contains(int64_t px, int64_t py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
};

enum class HitKind {
    None,
    Row,
    CommentBox,
};

struct LayoutHit {
    HitKind kind = HitKind::None;
    size_t row = 0;
};

// Pixel height of the comment box under a row, 0 when the row has none.
using CommentHeightFn = std::function<int64_t(size_t row)>;

LayoutHit
resolve_hit(int64_t y, size_t row_count, int64_t row_height, const CommentHeightFn& comment_height);

// Top of `row`. Rows past the end map to the content height.
int64_t
row_to_y(size_t row, size_t row_count, int64_t row_height, const CommentHeightFn& comment_height);

int64_t
content_height(size_t row_count, int64_t row_height, const CommentHeightFn& comment_height);

struct CommentBoxMetrics {
    int64_t line_height = 18;
    int64_t padding = 8;
    int64_t button_height = 24;
    int64_t button_width = 72;
};

// Height of a box showing `text` wrapped to `text_columns`. Embedded newlines start new
// lines; empty text still gets one line for the cursor.
int64_t
comment_box_height(std::string_view text, int64_t text_columns, int64_t tab_width, const CommentBoxMetrics& metrics);

struct CommentBoxLayout {
    Rect text_area;
    Rect submit;
    Rect cancel;
    Rect remove;
};

//  +--------------------------------------------+
//  | text_area                                  |
//  |                                            |
//  | [remove]               [cancel] [submit]   |
//  +--------------------------------------------+
CommentBoxLayout
comment_box_layout(const Rect& box, const CommentBoxMetrics& metrics);

// Scroll offset that brings `row` and its comment box into a viewport of
// `viewport_height` currently scrolled to `scroll`. The top of the row wins when both
// can't fit.
int64_t
scroll_to_reveal(int64_t scroll,
                 int64_t viewport_height,
                 size_t row,
                 size_t row_count,
                 int64_t row_height,
                 const CommentHeightFn& comment_height);

}  // namespace diffreview
