#include "untracked.hpp"

#include "util/log.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

using namespace diffreview;

namespace {

std::string
file_header(const std::string& path) {
    return fmt::format("diff --git a/{0} b/{0}\n"
                       "new file mode 100644\n"
                       "--- /dev/null\n"
                       "+++ b/{0}\n",
                       path);
}

}  // namespace

bool
diffreview::looks_binary(const std::string& head) {
    return head.find('\0') != std::string::npos;
}

std::string
diffreview::synthesize_new_file_diff(const std::string& path, const std::string& contents) {
    std::string out = file_header(path);

    bool missing_final_newline = false;
    auto lines = splitlines(contents, &missing_final_newline);
    if (lines.empty()) {
        return out;
    }

    out += fmt::format("@@ -0,0 +1,{} @@\n", lines.size());
    for (const auto& line : lines) {
        out += '+';
        out.append(line.data(), line.size());
        out += '\n';
    }
    if (missing_final_newline) {
        out += "\\ No newline at end of file\n";
    }
    return out;
}

std::string
diffreview::synthesize_placeholder_diff(const std::string& path, const std::string& placeholder) {
    std::string out = file_header(path);
    out += "@@ -0,0 +1,1 @@\n";
    out += fmt::format("+{}\n", placeholder);
    return out;
}

std::string
diffreview::synthesize_untracked_diff(const std::string& repo_root,
                                      const std::vector<std::string>& relative_paths,
                                      const UntrackedOptions& options) {
    std::string out;

    for (const auto& relative_path : relative_paths) {
        const std::string full_path = (fs::path(repo_root) / relative_path).string();

        std::error_code ec;
        if (!fs::is_regular_file(full_path, ec)) {
            log_debug("skipping untracked '{}': not a regular file", relative_path);
            continue;
        }

        std::string head;
        auto status = read_file_head(full_path, options.binary_check_bytes, head);
        if (status != ReadStatus::kOk) {
            log_warning("failed to read untracked file '{}': {}", full_path, to_string(status));
            continue;
        }

        if (looks_binary(head)) {
            out += synthesize_placeholder_diff(relative_path, "(binary file not shown)");
            continue;
        }

        auto size = fs::file_size(full_path, ec);
        if (ec) {
            log_warning("failed to stat untracked file '{}': {}", full_path, ec.message());
            continue;
        }
        if (size > options.max_file_bytes) {
            out += synthesize_placeholder_diff(
                relative_path, fmt::format("(file too large to show: {} bytes)", size));
            continue;
        }

        std::string contents;
        status = read_file(full_path, options.max_file_bytes, contents);
        if (status == ReadStatus::kTooLarge) {
            // Grew between the stat and the read.
            out += synthesize_placeholder_diff(relative_path, "(file too large to show)");
            continue;
        }
        if (status != ReadStatus::kOk) {
            log_warning("failed to read untracked file '{}': {}", full_path, to_string(status));
            continue;
        }

        out += synthesize_new_file_diff(relative_path, contents);
    }

    return out;
}
