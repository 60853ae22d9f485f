#pragma once

/*
    Obtain the diff text for a working tree.

    GitDiffSource runs, in order:

        git -C <root> diff --no-ext-diff --no-color --unified=<n>
        git -C <root> diff --staged --no-ext-diff --no-color --unified=<n>
        git -C <root> ls-files --others --exclude-standard -z

    and joins the two diffs and the synthesized untracked-file diffs with a blank line.
    The total is capped at `max_diff_bytes`; going over it discards everything.
*/

#include "processing/untracked.hpp"
#include "util/readlines.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace diffreview {

enum class AcquireStatus {
    kOk,
    kNoChanges,
    kToolFailed,
    kTooLarge,
};

std::string
to_string(AcquireStatus status);

struct DiffAcquisition {
    AcquireStatus status = AcquireStatus::kToolFailed;
    std::string text;

    // User facing explanation for any status other than kOk.
    std::string message;
};

class DiffSource {
   public:
    virtual ~DiffSource() = default;

    virtual DiffAcquisition
    acquire(const std::string& repo_root) = 0;
};

struct CommandResult {
    bool started = false;
    int exit_code = -1;
    ReadStatus read_status = ReadStatus::kOk;
    std::string output;
};

// Runs a shell command, capturing at most `max_bytes` of its standard output.
using CommandRunner = std::function<CommandResult(const std::string& command, std::size_t max_bytes)>;

CommandResult
run_command(const std::string& command, std::size_t max_bytes);

std::string
shell_quote(const std::string& arg);

// Join non-empty parts with a blank line in between.
std::string
combine_diff_text(const std::string& unstaged, const std::string& staged, const std::string& untracked);

// Split NUL separated `ls-files -z` output.
std::vector<std::string>
parse_path_list(const std::string& output);

struct AcquireOptions {
    std::size_t max_diff_bytes = 10 * 1024 * 1024;
    int64_t context_lines = 3;
    bool include_untracked = true;
    UntrackedOptions untracked;
};

class GitDiffSource : public DiffSource {
   public:
    explicit GitDiffSource(AcquireOptions options, CommandRunner runner = run_command);

    DiffAcquisition
    acquire(const std::string& repo_root) override;

   private:
    AcquireOptions options_;
    CommandRunner runner_;
};

}  // namespace diffreview
