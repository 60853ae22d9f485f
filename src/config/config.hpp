#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace diffreview {

struct ProgramOptions {
    bool help = false;
    bool version = false;
    bool list = false;
    bool send = false;

    // Wrap width in columns. -1 means the terminal width, 0 disables wrapping.
    int64_t width = -1;

    int64_t tab_width = 4;
    int64_t context_lines = 3;
    int64_t max_diff_bytes = 10 * 1024 * 1024;
    int64_t max_untracked_bytes = 1024 * 1024;
    int64_t binary_check_bytes = 8 * 1024;

    int64_t row_height = 22;
    int64_t comment_line_height = 18;
    int64_t comment_padding = 8;
    int64_t comment_button_height = 24;

    std::string agent_command;

    std::string repo_root = ".";
    std::vector<std::string> collapse;
    std::vector<std::pair<std::size_t, std::string>> add;
    std::vector<std::size_t> remove;
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::string
config_get_directory();

// Overlay the settings stored in `config_path` on `program_options`. A missing file is
// created holding the current values.
ConfigLoadResult
config_apply_file(const std::string& config_path, ProgramOptions& program_options);

// config_apply_file() on `<config home>/diffreview/diffreview.json`.
void
config_apply_options(ProgramOptions& program_options);

}  // namespace diffreview
