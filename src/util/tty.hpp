#pragma once

namespace diffreview {

// Size of the controlling terminal. Falls back to the COLUMNS and LINES environment
// variables; returns false when neither gives an answer.
bool
tty_get_term_size(int* rows, int* cols);

// Whether standard output is a terminal, i.e. whether styled output makes sense.
bool
tty_is_interactive();

}  // namespace diffreview
