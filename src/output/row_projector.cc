#include "row_projector.hpp"

#include "util/utf8decode.hpp"

using namespace diffreview;

std::vector<std::size_t>
diffreview::wrap_line_offsets(std::string_view text, int64_t width, int64_t tab_width) {
    std::vector<std::size_t> offsets{0};

    if (width <= 0 || display_width(text, tab_width) <= width) {
        return offsets;
    }

    std::size_t row_start = 0;
    std::size_t pos = 0;
    int64_t column = 0;
    while (pos < text.size()) {
        int64_t unit_width = utf8_unit_width(text, pos, tab_width);
        if (column + unit_width > width && pos > row_start) {
            offsets.push_back(pos);
            row_start = pos;
            column = 0;
            continue;
        }
        column += unit_width;
        pos = utf8_next(text, pos);
    }

    return offsets;
}

std::vector<DisplayRow>
diffreview::project_rows(gsl::span<const DiffFile> files, const ProjectionOptions& options) {
    std::vector<DisplayRow> rows;

    for (std::size_t file_idx = 0; file_idx < files.size(); file_idx++) {
        const DiffFile& file = files[file_idx];
        rows.push_back(FileHeaderRow{file_idx});

        if (file.collapsed) {
            continue;
        }

        for (std::size_t hunk_idx = 0; hunk_idx < file.hunks.size(); hunk_idx++) {
            const DiffHunk& hunk = file.hunks[hunk_idx];
            rows.push_back(HunkHeaderRow{file_idx, hunk_idx});

            for (std::size_t line_idx = 0; line_idx < hunk.lines.size(); line_idx++) {
                const auto offsets = wrap_line_offsets(hunk.lines[line_idx].text, options.wrap_width,
                                                       options.tab_width);
                for (auto offset : offsets) {
                    rows.push_back(DiffLineRow{file_idx, hunk_idx, line_idx, offset});
                }
            }
        }
    }

    return rows;
}

const DiffLine*
diffreview::line_for_row(gsl::span<const DiffFile> files, const DiffLineRow& row) {
    if (row.file >= files.size()) {
        return nullptr;
    }
    const DiffFile& file = files[row.file];
    if (row.hunk >= file.hunks.size()) {
        return nullptr;
    }
    const DiffHunk& hunk = file.hunks[row.hunk];
    if (row.line >= hunk.lines.size()) {
        return nullptr;
    }
    return &hunk.lines[row.line];
}

std::size_t
diffreview::final_wrap_row(gsl::span<const DisplayRow> rows, std::size_t row) {
    if (row >= rows.size()) {
        return row;
    }
    const auto* line_row = std::get_if<DiffLineRow>(&rows[row]);
    if (!line_row) {
        return row;
    }

    while (row + 1 < rows.size()) {
        const auto* next = std::get_if<DiffLineRow>(&rows[row + 1]);
        if (!next || !next->same_line(*line_row)) {
            break;
        }
        row++;
    }
    return row;
}

std::string_view
diffreview::row_text_slice(gsl::span<const DiffFile> files, gsl::span<const DisplayRow> rows, std::size_t row) {
    if (row >= rows.size()) {
        return {};
    }
    const auto* line_row = std::get_if<DiffLineRow>(&rows[row]);
    if (!line_row) {
        return {};
    }
    const DiffLine* line = line_for_row(files, *line_row);
    if (!line || line_row->byte_offset > line->text.size()) {
        return {};
    }

    std::size_t end = line->text.size();
    if (row + 1 < rows.size()) {
        const auto* next = std::get_if<DiffLineRow>(&rows[row + 1]);
        if (next && next->same_line(*line_row) && next->byte_offset <= end) {
            end = next->byte_offset;
        }
    }

    std::string_view text = line->text;
    return text.substr(line_row->byte_offset, end - line_row->byte_offset);
}
