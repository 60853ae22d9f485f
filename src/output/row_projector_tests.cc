#include "output/row_projector.hpp"
#include "processing/diff_parser.hpp"
#include "util/utf8decode.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace diffreview;

namespace {

std::vector<std::string>
slices(std::string_view text, int64_t width, int64_t tab_width = 4) {
    auto offsets = wrap_line_offsets(text, width, tab_width);
    std::vector<std::string> out;
    for (std::size_t i = 0; i < offsets.size(); i++) {
        std::size_t end = i + 1 < offsets.size() ? offsets[i + 1] : text.size();
        out.emplace_back(text.substr(offsets[i], end - offsets[i]));
    }
    return out;
}

std::size_t
count_rows_of_file(const std::vector<DisplayRow>& rows, std::size_t file) {
    std::size_t count = 0;
    for (const auto& row : rows) {
        if (const auto* h = std::get_if<HunkHeaderRow>(&row); h && h->file == file) {
            count++;
        } else if (const auto* l = std::get_if<DiffLineRow>(&row); l && l->file == file) {
            count++;
        }
    }
    return count;
}

const std::string kTwoFiles = "diff --git a/x.txt b/x.txt\n"
                              "@@ -1,2 +1,3 @@\n"
                              " context\n"
                              "-old\n"
                              "+new\n"
                              "+added\n"
                              "diff --git a/y.txt b/y.txt\n"
                              "@@ -4,1 +4,1 @@\n"
                              "-abcdefghijklmnop\n"
                              "+ABCDEFGHIJKLMNOPQRST\n";

}  // namespace

TEST_CASE("wrap_line_offsets") {
    SUBCASE("example") {
        auto offsets = wrap_line_offsets("abcdefgh", 5, 4);
        REQUIRE(offsets == std::vector<std::size_t>{0, 5});
        REQUIRE(slices("abcdefgh", 5) == std::vector<std::string>{"abcde", "fgh"});
    }

    SUBCASE("fits") {
        CHECK(wrap_line_offsets("abcde", 5, 4) == std::vector<std::size_t>{0});
        CHECK(wrap_line_offsets("", 5, 4) == std::vector<std::size_t>{0});
    }

    SUBCASE("unlimited") {
        CHECK(wrap_line_offsets(std::string(500, 'x'), 0, 4) == std::vector<std::size_t>{0});
    }

    SUBCASE("tabs_count_as_tab_width") {
        REQUIRE(slices("\tab\tcd", 6) == std::vector<std::string>{"\tab", "\tcd"});
    }

    SUBCASE("over_width_unit_gets_its_own_row") {
        REQUIRE(slices("a\tb", 3) == std::vector<std::string>{"a", "\t", "b"});
    }

    SUBCASE("control_bytes_take_no_columns") {
        std::string text = "ab\x1b[0mcd";
        // "\x1b" is invisible, "[0m" are three ordinary columns.
        REQUIRE(slices(text, 4) == std::vector<std::string>{"ab\x1b[0", "mcd"});
    }

    SUBCASE("multibyte_boundaries") {
        REQUIRE(slices("åäöåäö", 4) == std::vector<std::string>{"åäöå", "äö"});
        REQUIRE(slices("a€€b", 2) == std::vector<std::string>{"a€", "€b"});
    }
}

TEST_CASE("wrap_properties") {
    const std::vector<std::string> texts = {
        "",
        "x",
        "plain ascii text that goes on for a while",
        "\t\tindented\twith tabs",
        "öl och bål på skären",
        "mixed € and 漢字 and \x01 controls\x7f",
        std::string("\xE2\x82") + "truncated",
        "\xF0\x9F\x98\x80 emoji \xF0\x9F\x98\x80",
    };

    for (int64_t width = 1; width <= 12; width++) {
        for (const auto& text : texts) {
            CAPTURE(width);
            CAPTURE(text);

            auto offsets = wrap_line_offsets(text, width, 4);
            REQUIRE(offsets.front() == 0);

            std::string joined;
            for (std::size_t i = 0; i < offsets.size(); i++) {
                std::size_t end = i + 1 < offsets.size() ? offsets[i + 1] : text.size();
                if (!text.empty()) {
                    REQUIRE(end > offsets[i]);
                }
                if (i > 0) {
                    REQUIRE(offsets[i] > offsets[i - 1]);
                }

                std::string_view slice = std::string_view(text).substr(offsets[i], end - offsets[i]);
                joined += slice;

                // Width bound, unless the slice is a single over-wide unit.
                if (utf8_next(slice, 0) < slice.size()) {
                    CHECK(display_width(slice, 4) <= width);
                }

                // Never split inside a sequence.
                if (end < text.size()) {
                    CHECK_FALSE(utf8_is_continuation(static_cast<unsigned char>(text[end])));
                }
            }
            REQUIRE(joined == text);
        }
    }
}

TEST_CASE("project_rows") {
    auto files = parse_diff(kTwoFiles);
    REQUIRE(files.size() == 2);

    SUBCASE("unwrapped") {
        auto rows = project_rows(files, {0, 4});
        REQUIRE(rows.size() == 10);
        CHECK(std::holds_alternative<FileHeaderRow>(rows[0]));
        CHECK(std::holds_alternative<HunkHeaderRow>(rows[1]));
        CHECK(rows[2] == DisplayRow{DiffLineRow{0, 0, 0, 0}});
        CHECK(rows[5] == DisplayRow{DiffLineRow{0, 0, 3, 0}});
        CHECK(rows[6] == DisplayRow{FileHeaderRow{1}});
        CHECK(rows[7] == DisplayRow{HunkHeaderRow{1, 0}});
    }

    SUBCASE("wrapped") {
        auto rows = project_rows(files, {8, 4});
        // y.txt: 16 bytes -> 2 rows, 20 bytes -> 3 rows
        REQUIRE(rows.size() == 13);
        CHECK(rows[8] == DisplayRow{DiffLineRow{1, 0, 0, 0}});
        CHECK(rows[9] == DisplayRow{DiffLineRow{1, 0, 0, 8}});
        CHECK(rows[12] == DisplayRow{DiffLineRow{1, 0, 1, 16}});

        CHECK(row_text_slice(files, rows, 9) == "ijklmnop");
        CHECK(row_text_slice(files, rows, 12) == "QRST");
        CHECK(row_text_slice(files, rows, 0).empty());
    }

    SUBCASE("idempotent") {
        ProjectionOptions options{5, 4};
        REQUIRE(project_rows(files, options) == project_rows(files, options));
    }

    SUBCASE("fold") {
        auto rows = project_rows(files, {8, 4});
        const auto expanded_count = rows.size();
        const auto y_rows = count_rows_of_file(rows, 1);
        REQUIRE(y_rows > 0);

        files[1].collapsed = true;
        auto folded = project_rows(files, {8, 4});
        CHECK(count_rows_of_file(folded, 1) == 0);
        CHECK(folded.size() == expanded_count - y_rows);

        std::size_t headers = 0;
        for (const auto& row : folded) {
            if (const auto* h = std::get_if<FileHeaderRow>(&row); h && h->file == 1) {
                headers++;
            }
        }
        CHECK(headers == 1);

        files[1].collapsed = false;
        CHECK(project_rows(files, {8, 4}).size() == expanded_count);
    }
}

TEST_CASE("final_wrap_row") {
    auto files = parse_diff(kTwoFiles);
    auto rows = project_rows(files, {8, 4});

    CHECK(final_wrap_row(rows, 8) == 9);
    CHECK(final_wrap_row(rows, 9) == 9);
    CHECK(final_wrap_row(rows, 10) == 12);
    CHECK(final_wrap_row(rows, 11) == 12);
    CHECK(final_wrap_row(rows, 2) == 2);
    // Headers map to themselves.
    CHECK(final_wrap_row(rows, 7) == 7);
    CHECK(final_wrap_row(rows, 100) == 100);
}
