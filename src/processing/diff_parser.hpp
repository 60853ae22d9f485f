#pragma once

/*
    Parse unified diff text, as produced by `git diff`, into DiffFiles.

    The input is untrusted tool output, so parsing is best-effort: malformed hunk
    headers get zero start lines, unknown lines are skipped and nothing is ever
    reported as an error. The only failure that escapes is std::bad_alloc.
*/

#include "processing/diff_model.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace diffreview {

struct HunkRange {
    int64_t old_start = 0;
    int64_t old_count = 0;
    int64_t new_start = 0;
    int64_t new_count = 0;

    // False when either side of the header could not be read.
    bool valid = false;
};

// Read the ranges of a "@@ -a,b +c,d @@" header. Missing counts default to 1.
HunkRange
parse_hunk_header(std::string_view line);

// Path of the new side of a "diff --git a/<p> b/<p>" line, given the part after
// "diff --git ". Falls back to the whole remainder when there is no "b/" delimiter.
std::string
path_from_diff_header(std::string_view remainder);

// Whether the line is per-file metadata (index, ---/+++, mode and rename markers).
bool
is_metadata_line(std::string_view line);

std::vector<DiffFile>
parse_diff(std::string_view raw_text);

}  // namespace diffreview
