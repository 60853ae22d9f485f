#include "output/row_layout.hpp"

#include <doctest.h>

#include <map>

using namespace diffreview;

namespace {

// Rows 1 and 3 carry comment boxes of 30 and 50 pixels.
int64_t
two_boxes(size_t row) {
    static const std::map<size_t, int64_t> heights = {{1, 30}, {3, 50}};
    auto it = heights.find(row);
    return it == heights.end() ? 0 : it->second;
}

}  // namespace

TEST_CASE("resolve_hit") {
    const size_t rows = 5;
    const int64_t h = 20;

    SUBCASE("plain_rows") {
        auto hit = resolve_hit(0, rows, h, nullptr);
        CHECK(hit.kind == HitKind::Row);
        CHECK(hit.row == 0);

        hit = resolve_hit(99, rows, h, nullptr);
        CHECK(hit.kind == HitKind::Row);
        CHECK(hit.row == 4);

        CHECK(resolve_hit(100, rows, h, nullptr).kind == HitKind::None);
        CHECK(resolve_hit(-1, rows, h, nullptr).kind == HitKind::None);
        CHECK(resolve_hit(0, 0, h, nullptr).kind == HitKind::None);
    }

    SUBCASE("with_comment_boxes") {
        // row0 [0,20) row1 [20,40) box1 [40,70) row2 [70,90) row3 [90,110) box3 [110,160) row4 [160,180)
        struct Expected {
            int64_t y;
            HitKind kind;
            size_t row;
        };
        const Expected expected[] = {
            {19, HitKind::Row, 0},        {20, HitKind::Row, 1},         {40, HitKind::CommentBox, 1},
            {69, HitKind::CommentBox, 1}, {70, HitKind::Row, 2},         {109, HitKind::Row, 3},
            {110, HitKind::CommentBox, 3}, {159, HitKind::CommentBox, 3}, {160, HitKind::Row, 4},
        };
        for (const auto& e : expected) {
            CAPTURE(e.y);
            auto hit = resolve_hit(e.y, rows, h, two_boxes);
            CHECK(hit.kind == e.kind);
            CHECK(hit.row == e.row);
        }
        CHECK(resolve_hit(180, rows, h, two_boxes).kind == HitKind::None);
    }
}

TEST_CASE("row_to_y") {
    CHECK(row_to_y(0, 5, 20, two_boxes) == 0);
    CHECK(row_to_y(2, 5, 20, two_boxes) == 70);
    CHECK(row_to_y(4, 5, 20, two_boxes) == 160);
    CHECK(row_to_y(9, 5, 20, two_boxes) == 180);
    CHECK(content_height(5, 20, two_boxes) == 180);
    CHECK(content_height(5, 20, nullptr) == 100);

    // Every row top resolves back to the row.
    for (size_t row = 0; row < 5; row++) {
        auto hit = resolve_hit(row_to_y(row, 5, 20, two_boxes), 5, 20, two_boxes);
        CHECK(hit.kind == HitKind::Row);
        CHECK(hit.row == row);
    }
}

TEST_CASE("comment_box_height") {
    CommentBoxMetrics metrics{18, 8, 24, 72};
    const int64_t chrome = 24 + 3 * 8;

    CHECK(comment_box_height("", 10, 4, metrics) == 18 + chrome);
    CHECK(comment_box_height("short", 10, 4, metrics) == 18 + chrome);
    CHECK(comment_box_height("0123456789abcde", 10, 4, metrics) == 2 * 18 + chrome);
    CHECK(comment_box_height("one\ntwo\nthree", 10, 4, metrics) == 3 * 18 + chrome);
    CHECK(comment_box_height("one\n", 10, 4, metrics) == 2 * 18 + chrome);
}

TEST_CASE("comment_box_layout") {
    CommentBoxMetrics metrics{18, 8, 24, 72};
    Rect box{100, 200, 400, 90};
    auto layout = comment_box_layout(box, metrics);

    CHECK(layout.text_area.x == 108);
    CHECK(layout.text_area.y == 208);
    CHECK(layout.text_area.width == 384);
    CHECK(layout.text_area.height == 90 - 24 - 24);

    CHECK(layout.submit.x == 100 + 400 - 8 - 72);
    CHECK(layout.submit.y == 200 + 90 - 8 - 24);
    CHECK(layout.cancel.x == layout.submit.x - 8 - 72);
    CHECK(layout.remove.x == 108);

    CHECK(layout.submit.contains(layout.submit.x, layout.submit.y));
    CHECK_FALSE(layout.submit.contains(layout.cancel.x, layout.cancel.y));
    CHECK(box.contains(layout.remove.x, layout.remove.y + layout.remove.height - 1));
}

TEST_CASE("scroll_to_reveal") {
    // Viewport of 60 pixels.
    CHECK(scroll_to_reveal(0, 60, 0, 5, 20, two_boxes) == 0);
    // Row 1 with its box ends at 70.
    CHECK(scroll_to_reveal(0, 60, 1, 5, 20, two_boxes) == 10);
    // Row 3 with its box is 70 tall, more than the viewport: keep its top.
    CHECK(scroll_to_reveal(0, 60, 3, 5, 20, two_boxes) == 90);
    // Scrolling back up.
    CHECK(scroll_to_reveal(120, 60, 2, 5, 20, two_boxes) == 70);
    // Already visible.
    CHECK(scroll_to_reveal(60, 60, 2, 5, 20, two_boxes) == 60);
    CHECK(scroll_to_reveal(42, 60, 7, 5, 20, two_boxes) == 42);
}
