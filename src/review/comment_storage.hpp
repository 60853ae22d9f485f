#pragma once

/*
    On-disk form of the review comments, `<repo root>/.architect/diff_comments.json`:

        [
          {"file": "src/main.cc", "line": 12, "text": "Why not reuse the buffer?"},
          {"file": "src/main.cc", "line": 9, "text": "This was needed."}
        ]

    "line" is the old-side number for removed lines and the new-side number otherwise.
    Only comments that have not been sent are stored.
*/

#include "review/comments.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace diffreview {

std::string
comments_file_path(const std::string& repo_root);

std::string
serialize_comments(const std::vector<DiffComment>& comments);

// Entries that are not objects or lack a usable file, line or text are skipped; unknown
// keys are ignored. Input that is not a JSON array gives an empty list.
std::vector<DiffComment>
deserialize_comments(std::string_view json_text);

// A missing or unreadable file gives an empty list.
std::vector<DiffComment>
load_comments(const std::string& repo_root);

// Failures are logged and reported through the return value; nothing is thrown.
bool
save_comments(const std::string& repo_root, const std::vector<DiffComment>& comments);

}  // namespace diffreview
