#pragma once

/*
    Render untracked files as "new file" diffs so they go through the same parser as
    the tracked changes.

        diff --git a/<p> b/<p>
        new file mode 100644
        --- /dev/null
        +++ b/<p>
        @@ -0,0 +1,N @@
        +<line 1>
        ...

    Binary and oversized files get a single placeholder line instead of their content.
*/

#include <cstdint>
#include <string>
#include <vector>

namespace diffreview {

struct UntrackedOptions {
    std::size_t max_file_bytes = 1024 * 1024;

    // A NUL byte inside this many leading bytes marks a file as binary.
    std::size_t binary_check_bytes = 8 * 1024;
};

bool
looks_binary(const std::string& head);

// Diff text for one file, given its contents.
std::string
synthesize_new_file_diff(const std::string& path, const std::string& contents);

// Diff text for one file that is shown as a placeholder line.
std::string
synthesize_placeholder_diff(const std::string& path, const std::string& placeholder);

// Diff text for every readable path, relative to `repo_root`, concatenated in order.
std::string
synthesize_untracked_diff(const std::string& repo_root,
                          const std::vector<std::string>& relative_paths,
                          const UntrackedOptions& options);

}  // namespace diffreview
