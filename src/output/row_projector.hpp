#pragma once

/*
    Project a parsed diff into the flat list of rows a renderer walks.

        FileHeader              one per file, also the fold handle
          HunkHeader            skipped while the file is collapsed
            DiffLine            one per wrapped slice of each hunk line
            DiffLine (cont.)
          ...

    Wrapping is greedy over display columns and only ever splits between UTF-8 code
    points. Concatenating the slices of a line in order gives back the line text.
*/

#include "output/display_row.hpp"
#include "processing/diff_model.hpp"

#include <gsl/span>

#include <cstdint>
#include <string_view>
#include <vector>

namespace diffreview {

struct ProjectionOptions {
    // Display columns per row; 0 means never wrap.
    int64_t wrap_width = 0;
    int64_t tab_width = 4;
};

// Start offsets of the slices `text` wraps into. Always starts with 0, and holds a
// single entry when the text fits. Every slice holds at least one code point, so a
// unit wider than `width` on its own (a tab in a narrow column) gets a row to itself.
std::vector<std::size_t>
wrap_line_offsets(std::string_view text, int64_t width, int64_t tab_width);

std::vector<DisplayRow>
project_rows(gsl::span<const DiffFile> files, const ProjectionOptions& options);

// The diff line behind a row, or nullptr when the indices are stale.
const DiffLine*
line_for_row(gsl::span<const DiffFile> files, const DiffLineRow& row);

// Last wrap continuation of the logical line `row` belongs to. Rows that are not diff
// lines are returned as they are.
std::size_t
final_wrap_row(gsl::span<const DisplayRow> rows, std::size_t row);

// The part of the line text a diff line row shows. Empty for other rows.
std::string_view
row_text_slice(gsl::span<const DiffFile> files, gsl::span<const DisplayRow> rows, std::size_t row);

}  // namespace diffreview
