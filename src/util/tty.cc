#include "tty.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>

using namespace diffreview;

namespace {

int
env_int(const char* name) {
    const char* value = getenv(name);
    return value ? std::atoi(value) : 0;
}

}  // namespace

bool
diffreview::tty_get_term_size(int* rows, int* cols) {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        *rows = w.ws_row;
        *cols = w.ws_col;
        return true;
    }

    // stdout may be a pipe; ask the controlling terminal instead.
    int term_fd = open(ctermid(nullptr), O_RDONLY);
    if (term_fd >= 0) {
        bool ok = ioctl(term_fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0;
        close(term_fd);
        if (ok) {
            *rows = w.ws_row;
            *cols = w.ws_col;
            return true;
        }
    }

    int env_cols = env_int("COLUMNS");
    if (env_cols > 0) {
        *cols = env_cols;
        *rows = env_int("LINES");
        return true;
    }
    return false;
}

bool
diffreview::tty_is_interactive() {
    return isatty(STDOUT_FILENO) != 0;
}
