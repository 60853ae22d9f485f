#include "agent.hpp"

#include "util/log.hpp"

#include <sys/wait.h>

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

using namespace diffreview;

std::string
diffreview::format_comments_for_agent(const std::vector<DiffComment>& comments) {
    std::string out;
    for (const auto& comment : comments) {
        if (comment.sent) {
            continue;
        }
        if (!out.empty()) {
            out += '\n';
        }
        out += fmt::format("{}:{}: {}\n", comment.key.file_path, comment.key.line_number, comment.text);
    }
    return out;
}

bool
PipeAgentSink::deliver(const std::string& payload, const std::string& command) {
    if (command.empty()) {
        log_error("no agent command configured");
        return false;
    }

    FILE* pipe = popen(command.c_str(), "w");
    if (!pipe) {
        log_error("failed to spawn '{}': {}", command, strerror(errno));
        return false;
    }

    bool written = fwrite(payload.data(), 1, payload.size(), pipe) == payload.size();
    if (!written) {
        log_error("failed to write to '{}': {}", command, strerror(errno));
    }

    int status = pclose(pipe);
    if (status == -1) {
        log_error("failed to wait for '{}': {}", command, strerror(errno));
        return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        log_error("agent command '{}' failed", command);
        return false;
    }

    log_debug("delivered {} bytes to '{}'", payload.size(), command);
    return written;
}
