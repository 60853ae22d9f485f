#include "diff_parser.hpp"

#include "util/readlines.hpp"

#include <array>
#include <limits>

using namespace diffreview;

namespace {

bool
starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool
is_digit(char c) {
    return c >= '0' && c <= '9';
}

constexpr int64_t kMaxLineNumber = std::numeric_limits<int64_t>::max();

// Consumes every digit at `pos`. Returns false when the number does not fit.
bool
parse_decimal_number(std::string_view s, std::size_t& pos, int64_t& value) {
    bool fits = true;
    value = 0;
    for (; pos < s.size() && is_digit(s[pos]); pos++) {
        const int64_t digit = s[pos] - '0';
        if (value > (kMaxLineNumber - digit) / 10) {
            fits = false;
        }
        if (fits) {
            value = value * 10 + digit;
        }
    }
    return fits;
}

// Reads "<start>[,<count>]" at `pos`; a missing count is 1.
bool
parse_range(std::string_view s, std::size_t& pos, int64_t& start, int64_t& count) {
    bool fits = parse_decimal_number(s, pos, start);
    count = 1;
    if (pos + 1 < s.size() && s[pos] == ',' && is_digit(s[pos + 1])) {
        pos++;
        fits = parse_decimal_number(s, pos, count) && fits;
    }
    return fits;
}

// Current value of a line cursor, then step it. Saturates instead of wrapping.
int64_t
take_line(int64_t& cursor) {
    const int64_t current = cursor;
    if (cursor < kMaxLineNumber) {
        cursor++;
    }
    return current;
}

// Find `sign` immediately followed by a digit, starting at `pos`. On success `pos`
// points at the first digit.
bool
find_signed_number(std::string_view s, char sign, std::size_t& pos) {
    for (; pos + 1 < s.size(); pos++) {
        if (s[pos] == sign && is_digit(s[pos + 1])) {
            pos++;
            return true;
        }
    }
    return false;
}

int
octal_digit(char c) {
    return (c >= '0' && c <= '7') ? c - '0' : -1;
}

// git quotes paths with unusual bytes as C strings: "b/\303\266.txt"
std::string
unquote_path(std::string_view quoted) {
    if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"') {
        return std::string(quoted);
    }
    quoted = quoted.substr(1, quoted.size() - 2);

    std::string out;
    out.reserve(quoted.size());
    for (std::size_t i = 0; i < quoted.size(); i++) {
        char c = quoted[i];
        if (c != '\\' || i + 1 >= quoted.size()) {
            out.push_back(c);
            continue;
        }

        char e = quoted[++i];
        if (octal_digit(e) >= 0 && i + 2 < quoted.size() && octal_digit(quoted[i + 1]) >= 0 &&
            octal_digit(quoted[i + 2]) >= 0) {
            int value = octal_digit(e) * 64 + octal_digit(quoted[i + 1]) * 8 + octal_digit(quoted[i + 2]);
            out.push_back(static_cast<char>(value));
            i += 2;
            continue;
        }

        switch (e) {
            case 'n':
                out.push_back('\n');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'r':
                out.push_back('\r');
                break;
            default:
                out.push_back(e);
                break;
        }
    }
    return out;
}

struct ParserState {
    std::vector<DiffFile> files;

    bool hunk_open = false;

    // Running line cursor shared by every line of the open hunk.
    int64_t old_line = 0;
    int64_t new_line = 0;

    // Lines still expected according to the hunk header, when it could be read. The
    // counts never close a hunk; they only tell the blank separator line that follows
    // a complete hunk from an empty context line.
    bool counted = false;
    int64_t old_remaining = 0;
    int64_t new_remaining = 0;

    DiffHunk&
    hunk() {
        return files.back().hunks.back();
    }

    void
    close_hunk() {
        hunk_open = false;
        counted = false;
    }
};

void
open_file(ParserState& state, std::string_view line) {
    state.close_hunk();

    DiffFile file;
    file.path = path_from_diff_header(line.substr(std::string_view("diff --git ").size()));
    state.files.push_back(std::move(file));
}

void
open_hunk(ParserState& state, std::string_view line) {
    state.close_hunk();

    // A hunk without a file header has nowhere to go.
    if (state.files.empty()) {
        return;
    }

    HunkRange range = parse_hunk_header(line);

    DiffHunk hunk;
    hunk.header = std::string(line);
    hunk.old_start = range.old_start;
    hunk.old_count = range.old_count;
    hunk.new_start = range.new_start;
    hunk.new_count = range.new_count;
    state.files.back().hunks.push_back(std::move(hunk));

    state.hunk_open = true;
    state.old_line = range.old_start;
    state.new_line = range.new_start;
    state.counted = range.valid;
    state.old_remaining = range.old_count;
    state.new_remaining = range.new_count;
}

bool
counts_used_up(const ParserState& state) {
    return state.counted && state.old_remaining == 0 && state.new_remaining == 0;
}

void
add_hunk_line(ParserState& state, std::string_view line) {
    DiffLine diff_line;

    char prefix = line.empty() ? '\0' : line[0];
    switch (prefix) {
        case '\\':
            // "\ No newline at end of file"
            return;
        case '+':
            diff_line.kind = LineKind::Add;
            diff_line.text = std::string(line.substr(1));
            diff_line.new_line_number = take_line(state.new_line);
            if (state.new_remaining > 0)
                state.new_remaining--;
            break;
        case '-':
            diff_line.kind = LineKind::Remove;
            diff_line.text = std::string(line.substr(1));
            diff_line.old_line_number = take_line(state.old_line);
            if (state.old_remaining > 0)
                state.old_remaining--;
            break;
        default:
            diff_line.kind = LineKind::Context;
            diff_line.text = std::string(prefix == ' ' ? line.substr(1) : line);
            diff_line.old_line_number = take_line(state.old_line);
            diff_line.new_line_number = take_line(state.new_line);
            if (state.old_remaining > 0)
                state.old_remaining--;
            if (state.new_remaining > 0)
                state.new_remaining--;
            break;
    }

    state.hunk().lines.push_back(std::move(diff_line));
}

}  // namespace

HunkRange
diffreview::parse_hunk_header(std::string_view line) {
    HunkRange range;

    bool fits = true;
    std::size_t pos = 0;
    bool has_old = find_signed_number(line, '-', pos);
    if (has_old) {
        fits = parse_range(line, pos, range.old_start, range.old_count);
    } else {
        pos = 0;
    }

    bool has_new = find_signed_number(line, '+', pos);
    if (has_new) {
        fits = parse_range(line, pos, range.new_start, range.new_count) && fits;
    }

    // Numbers too large to represent make the whole header unreadable.
    if (!fits) {
        return HunkRange{};
    }

    range.valid = has_old && has_new;
    if (!range.valid) {
        range.old_count = 0;
        range.new_count = 0;
    }
    return range;
}

std::string
diffreview::path_from_diff_header(std::string_view remainder) {
    // Quoted form: "a/<p>" "b/<p>"
    if (auto quoted = remainder.rfind(" \"b/"); quoted != std::string_view::npos) {
        std::string path = unquote_path(remainder.substr(quoted + 1));
        return path.substr(2);
    }

    // Identical old and new path: a/<p> b/<p>
    if (starts_with(remainder, "a/") && remainder.size() % 2 == 1) {
        std::size_t half = remainder.size() / 2;
        std::string_view left = remainder.substr(2, half - 2);
        std::string_view right = remainder.substr(half + 1);
        if (starts_with(right, "b/") && right.substr(2) == left) {
            return std::string(left);
        }
    }

    if (auto delim = remainder.find(" b/"); delim != std::string_view::npos) {
        return std::string(remainder.substr(delim + 3));
    }

    return std::string(remainder);
}

bool
diffreview::is_metadata_line(std::string_view line) {
    static const std::array<std::string_view, 16> prefixes = {
        "index ",
        "--- ",
        "+++ ",
        "new file",
        "deleted file",
        "old mode",
        "new mode",
        "rename from",
        "rename to",
        "copy from",
        "copy to",
        "similarity index",
        "dissimilarity index",
        "Binary files",
        "GIT binary patch",
        "diff --cc ",
    };

    for (const auto& prefix : prefixes) {
        if (starts_with(line, prefix)) {
            return true;
        }
    }
    return false;
}

std::vector<DiffFile>
diffreview::parse_diff(std::string_view raw_text) {
    ParserState state;

    LineCursor cursor{raw_text};
    std::string_view line;
    while (diffreview::getline(cursor, line)) {
        if (starts_with(line, "diff --git ")) {
            open_file(state, line);
            continue;
        }

        if (starts_with(line, "@@")) {
            open_hunk(state, line);
            continue;
        }

        if (!state.hunk_open) {
            // Metadata and anything else between hunks.
            continue;
        }

        // A hunk runs until the next file or hunk header whatever its header
        // claims. Metadata prefixes are never content, even inside a hunk.
        if (is_metadata_line(line)) {
            continue;
        }

        if (line.empty() && counts_used_up(state)) {
            continue;
        }

        add_hunk_line(state, line);
    }

    return std::move(state.files);
}
