#include "log.hpp"

#include <cstdio>
#include <cstdlib>

using namespace diffreview;

namespace {

LogLevel g_level = LogLevel::kWarning;

const char*
level_prefix(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarning:
            return "warning";
        case LogLevel::kError:
            return "error";
    }
    return "log";
}

}  // namespace

void
diffreview::log_set_level(LogLevel level) {
    g_level = level;
}

LogLevel
diffreview::log_get_level() {
    return g_level;
}

void
diffreview::log_init_from_env() {
    if (getenv("DIFFREVIEW_DEBUG") != nullptr) {
        g_level = LogLevel::kDebug;
    }
}

void
diffreview::log_write(LogLevel level, const std::string& message) {
    if (level < g_level) {
        return;
    }
    fmt::print(stderr, "{}: {}\n", level_prefix(level), message);
}
