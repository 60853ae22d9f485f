#include "acquire.hpp"

#include "util/log.hpp"

#include <sys/wait.h>

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

using namespace diffreview;

namespace {

const char* kToolFailedMessage = "No git diff available (not a git repository or git not found)";
const char* kNoChangesMessage = "No changes";

DiffAcquisition
failed(AcquireStatus status, std::string message) {
    DiffAcquisition result;
    result.status = status;
    result.message = std::move(message);
    return result;
}

DiffAcquisition
too_large(std::size_t max_bytes) {
    return failed(AcquireStatus::kTooLarge,
                  fmt::format("Diff too large to display (limit {} MiB)", max_bytes / (1024 * 1024)));
}

}  // namespace

std::string
diffreview::to_string(AcquireStatus status) {
    switch (status) {
        case AcquireStatus::kOk:
            return "ok";
        case AcquireStatus::kNoChanges:
            return "no changes";
        case AcquireStatus::kToolFailed:
            return "tool failed";
        case AcquireStatus::kTooLarge:
            return "too large";
        default:
            return "unknown";
    }
}

CommandResult
diffreview::run_command(const std::string& command, std::size_t max_bytes) {
    CommandResult result;

    // stderr isn't captured; keep git's complaints off the terminal.
    const std::string full_command = command + " 2>/dev/null";
    FILE* pipe = popen(full_command.c_str(), "r");
    if (!pipe) {
        log_warning("failed to spawn '{}': {}", command, strerror(errno));
        return result;
    }

    result.started = true;
    result.read_status = read_stream(pipe, max_bytes, result.output);

    int status = pclose(pipe);
    if (status == -1) {
        log_warning("failed to wait for '{}': {}", command, strerror(errno));
        return result;
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

std::string
diffreview::shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string
diffreview::combine_diff_text(const std::string& unstaged,
                              const std::string& staged,
                              const std::string& untracked) {
    std::string out;
    for (const std::string* part : {&unstaged, &staged, &untracked}) {
        if (part->empty()) {
            continue;
        }
        if (!out.empty()) {
            if (out.back() != '\n') {
                out += '\n';
            }
            out += '\n';
        }
        out += *part;
    }
    return out;
}

std::vector<std::string>
diffreview::parse_path_list(const std::string& output) {
    std::vector<std::string> paths;
    std::size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        if (end > start) {
            paths.push_back(output.substr(start, end - start));
        }
        start = end + 1;
    }
    return paths;
}

GitDiffSource::GitDiffSource(AcquireOptions options, CommandRunner runner)
    : options_(std::move(options))
    , runner_(std::move(runner)) {
}

DiffAcquisition
GitDiffSource::acquire(const std::string& repo_root) {
    const std::string git = fmt::format("git -C {}", shell_quote(repo_root));
    const std::string diff_flags = fmt::format("--no-ext-diff --no-color --unified={}", options_.context_lines);

    const std::size_t max_bytes = options_.max_diff_bytes;

    // Read a command's output with whatever is left of the byte budget.
    std::size_t used = 0;
    auto run = [&](const std::string& command, std::string& output) -> AcquireStatus {
        CommandResult result = runner_(command, max_bytes - used);
        if (!result.started || result.exit_code != 0) {
            log_debug("'{}' failed (started={}, exit={})", command, result.started, result.exit_code);
            return AcquireStatus::kToolFailed;
        }
        if (result.read_status == ReadStatus::kTooLarge) {
            return AcquireStatus::kTooLarge;
        }
        if (result.read_status != ReadStatus::kOk) {
            log_warning("failed to read output of '{}': {}", command, to_string(result.read_status));
            return AcquireStatus::kToolFailed;
        }
        used += result.output.size();
        output = std::move(result.output);
        return AcquireStatus::kOk;
    };

    std::string unstaged;
    switch (run(fmt::format("{} diff {}", git, diff_flags), unstaged)) {
        case AcquireStatus::kOk:
            break;
        case AcquireStatus::kTooLarge:
            return too_large(max_bytes);
        default:
            return failed(AcquireStatus::kToolFailed, kToolFailedMessage);
    }

    std::string staged;
    switch (run(fmt::format("{} diff --staged {}", git, diff_flags), staged)) {
        case AcquireStatus::kOk:
            break;
        case AcquireStatus::kTooLarge:
            return too_large(max_bytes);
        default:
            return failed(AcquireStatus::kToolFailed, kToolFailedMessage);
    }

    std::string untracked;
    if (options_.include_untracked) {
        std::string listing;
        switch (run(fmt::format("{} ls-files --others --exclude-standard -z", git), listing)) {
            case AcquireStatus::kOk: {
                untracked = synthesize_untracked_diff(repo_root, parse_path_list(listing), options_.untracked);
            } break;
            case AcquireStatus::kTooLarge:
                return too_large(max_bytes);
            default:
                // The tracked diff is still worth showing.
                log_warning("failed to list untracked files in '{}'", repo_root);
                break;
        }
    }

    DiffAcquisition result;
    result.text = combine_diff_text(unstaged, staged, untracked);
    if (result.text.size() > max_bytes) {
        return too_large(max_bytes);
    }
    if (result.text.empty()) {
        result.status = AcquireStatus::kNoChanges;
        result.message = kNoChangesMessage;
        return result;
    }

    result.status = AcquireStatus::kOk;
    return result;
}
