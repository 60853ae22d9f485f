#pragma once

/*
    Diagnostics on stderr.

    Messages are formatted with fmt and prefixed with their severity, e.g.

        warning: failed to write '/repo/.architect/diff_comments.json': Permission denied

    Anything below the current level is dropped before formatting.
*/

#include <fmt/format.h>

#include <string>
#include <utility>

namespace diffreview {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarning,
    kError,
};

void
log_set_level(LogLevel level);

LogLevel
log_get_level();

// Lower the threshold to debug when DIFFREVIEW_DEBUG is set in the environment.
void
log_init_from_env();

void
log_write(LogLevel level, const std::string& message);

template <typename... Args>
void
log_debug(fmt::format_string<Args...> format, Args&&... args) {
    if (log_get_level() <= LogLevel::kDebug) {
        log_write(LogLevel::kDebug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void
log_info(fmt::format_string<Args...> format, Args&&... args) {
    if (log_get_level() <= LogLevel::kInfo) {
        log_write(LogLevel::kInfo, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void
log_warning(fmt::format_string<Args...> format, Args&&... args) {
    if (log_get_level() <= LogLevel::kWarning) {
        log_write(LogLevel::kWarning, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void
log_error(fmt::format_string<Args...> format, Args&&... args) {
    log_write(LogLevel::kError, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace diffreview
