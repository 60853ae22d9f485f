#include "config/config.hpp"
#include "output/row_projector.hpp"
#include "processing/acquire.hpp"
#include "review/agent.hpp"
#include "review/review_session.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"
#include "util/tty.hpp"
#include "util/utf8decode.hpp"

#include <getopt.h>

#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#ifndef DIFFREVIEW_VERSION
#define DIFFREVIEW_VERSION "unknown"
#endif

namespace {

// "  row   old   new ± " in front of every diff line.
constexpr int64_t kGutterWidth = 6 + 6 + 6 + 2;

bool
parse_index(const std::string& text, std::size_t* out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    *out = static_cast<std::size_t>(std::strtoull(text.c_str(), nullptr, 10));
    return true;
}

// Tabs become spaces and invisible control bytes are dropped, so the terminal shows the
// same number of columns the projector counted.
std::string
printable(std::string_view text, int64_t tab_width) {
    std::string out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t next = diffreview::utf8_next(text, pos);
        if (text[pos] == '\t') {
            out.append(static_cast<std::size_t>(tab_width), ' ');
        } else if (diffreview::utf8_unit_width(text, pos, tab_width) > 0) {
            out.append(text.substr(pos, next - pos));
        }
        pos = next;
    }
    return out;
}

std::string
format_line_number(const std::optional<int64_t>& number) {
    return number ? fmt::format("{:>5}", *number) : std::string(5, ' ');
}

class RowPrinter {
   public:
    RowPrinter(const diffreview::ReviewSession& session, bool styled)
        : session_(session)
        , styled_(styled) {
    }

    void
    print() const {
        const auto& rows = session_.rows();
        for (std::size_t i = 0; i < rows.size(); i++) {
            std::visit([&](const auto& row) { print_row(i, row); }, rows[i]);
            if (auto comment = session_.comments().comment_at_row(i)) {
                print_comment(session_.comments().comments()[*comment].text);
            }
        }
    }

   private:
    fmt::text_style
    style(fmt::text_style s) const {
        return styled_ ? s : fmt::text_style{};
    }

    void
    print_row(std::size_t index, const diffreview::FileHeaderRow& row) const {
        const auto& file = session_.files()[row.file];
        fmt::print(style(fmt::emphasis::bold), "{:>5} {} {}\n", index, file.collapsed ? "[+]" : "[-]", file.path);
    }

    void
    print_row(std::size_t index, const diffreview::HunkHeaderRow& row) const {
        const auto& hunk = session_.files()[row.file].hunks[row.hunk];
        fmt::print(style(fmt::fg(fmt::terminal_color::cyan)), "{:>5} {}\n", index, hunk.header);
    }

    void
    print_row(std::size_t index, const diffreview::DiffLineRow& row) const {
        const diffreview::DiffLine* line = diffreview::line_for_row(session_.files(), row);
        if (!line) {
            return;
        }

        const auto text = printable(diffreview::row_text_slice(session_.files(), session_.rows(), index),
                                    session_.options().projection.tab_width);

        if (row.byte_offset > 0) {
            fmt::print("{:>5} {:>{}}{}\n", index, "", kGutterWidth - 6, text);
            return;
        }

        char marker = ' ';
        fmt::text_style line_style;
        switch (line->kind) {
            case diffreview::LineKind::Add:
                marker = '+';
                line_style = style(fmt::fg(fmt::terminal_color::green));
                break;
            case diffreview::LineKind::Remove:
                marker = '-';
                line_style = style(fmt::fg(fmt::terminal_color::red));
                break;
            case diffreview::LineKind::Context:
                break;
        }

        fmt::print("{:>5} {} {} ", index, format_line_number(line->old_line_number),
                   format_line_number(line->new_line_number));
        fmt::print(line_style, "{} {}\n", marker, text);
    }

    void
    print_row(std::size_t index, const diffreview::MessageRow& row) const {
        fmt::print("{:>5} {}\n", index, row.text);
    }

    void
    print_comment(const std::string& text) const {
        const int64_t width = session_.options().projection.wrap_width;
        for (auto line : diffreview::splitlines(text)) {
            auto offsets = diffreview::wrap_line_offsets(line, width, session_.options().projection.tab_width);
            for (std::size_t i = 0; i < offsets.size(); i++) {
                std::size_t end = i + 1 < offsets.size() ? offsets[i + 1] : line.size();
                fmt::print(style(fmt::fg(fmt::terminal_color::yellow)), "{:>{}}> {}\n", "", kGutterWidth - 2,
                           printable(line.substr(offsets[i], end - offsets[i]),
                                     session_.options().projection.tab_width));
            }
        }
    }

    const diffreview::ReviewSession& session_;
    bool styled_;
};

void
list_comments(const diffreview::ReviewSession& session) {
    const auto& comments = session.comments().comments();
    if (comments.empty()) {
        fmt::print("no comments\n");
        return;
    }
    for (std::size_t i = 0; i < comments.size(); i++) {
        const auto& comment = comments[i];
        std::string where = comment.sent ? "sent"
                            : comment.display_row_index ? fmt::format("row {}", *comment.display_row_index)
                                                        : "not shown";
        fmt::print("[{}] {}:{} ({}): {}\n", i, comment.key.file_path, comment.key.line_number, where, comment.text);
    }
}

}  // namespace

int
main(int argc, char* argv[]) {
    diffreview::log_init_from_env();

    // A failing agent command must not take us down with it.
    signal(SIGPIPE, SIG_IGN);

    diffreview::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] [repo_root]

Review the uncommitted changes of a git repository and attach comments to lines

Options:
    -h, --help               show help
    -v, --version            show program version and exit
    -W, --width N            wrap width in columns (default: terminal width, 0 = unlimited)
    -c, --collapse PATH      collapse a file (repeatable)
    -a, --add ROW:TEXT       add or update a comment on a display row
    -d, --delete INDEX       delete comment by index
    -l, --list               list comments with their anchors
    -s, --send               send unsent comments to the agent command
    -x, --command CMD        agent command (overrides config)
)",
                                       argv[0]);

        help += "\n";
        help += "Config directory:\n    " + diffreview::config_get_directory() + "\n";
        help += "Comments are stored in:\n    <repo_root>/.architect/diff_comments.json\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
        }
        puts(help.c_str());
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"width", required_argument, 0, 'W'},
                                               {"collapse", required_argument, 0, 'c'},
                                               {"add", required_argument, 0, 'a'},
                                               {"delete", required_argument, 0, 'd'},
                                               {"list", no_argument, 0, 'l'},
                                               {"send", no_argument, 0, 's'},
                                               {"command", required_argument, 0, 'x'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvW:c:a:d:lsx:", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'h':
                    opts.help = true;
                    return true;
                case 'v':
                    opts.version = true;
                    return true;
                case 'W': {
                    std::size_t width = 0;
                    if (!parse_index(optarg, &width)) {
                        show_help(fmt::format("error: invalid value for -W ({})\n", optarg));
                        return false;
                    }
                    opts.width = static_cast<int64_t>(width);
                    break;
                }
                case 'c':
                    opts.collapse.push_back(optarg);
                    break;
                case 'a': {
                    std::string arg = optarg;
                    auto colon = arg.find(':');
                    std::size_t row = 0;
                    if (colon == std::string::npos || !parse_index(arg.substr(0, colon), &row)) {
                        show_help(fmt::format("error: expected ROW:TEXT for -a ({})\n", arg));
                        return false;
                    }
                    opts.add.emplace_back(row, arg.substr(colon + 1));
                    break;
                }
                case 'd': {
                    std::size_t index = 0;
                    if (!parse_index(optarg, &index)) {
                        show_help(fmt::format("error: invalid value for -d ({})\n", optarg));
                        return false;
                    }
                    opts.remove.push_back(index);
                    break;
                }
                case 'l':
                    opts.list = true;
                    break;
                case 's':
                    opts.send = true;
                    break;
                case 'x':
                    opts.agent_command = optarg;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        int positional_count = in_argc - optind;
        if (positional_count > 1) {
            show_help("error: too many positional arguments");
            return false;
        }
        if (positional_count == 1) {
            opts.repo_root = in_argv[optind];
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    diffreview::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return 2;
    }

    if (opts.help) {
        show_help("");
        return 0;
    }

    if (opts.version) {
        fmt::print("version: {}\n", DIFFREVIEW_VERSION);
        return 0;
    }

    int64_t wrap_width = opts.width;
    if (wrap_width < 0) {
        int rows = 0, cols = 0;
        wrap_width = diffreview::tty_get_term_size(&rows, &cols) ? std::max<int64_t>(cols - kGutterWidth, 1) : 0;
    }

    diffreview::AcquireOptions acquire_options;
    acquire_options.max_diff_bytes = static_cast<std::size_t>(opts.max_diff_bytes);
    acquire_options.context_lines = opts.context_lines;
    acquire_options.untracked.max_file_bytes = static_cast<std::size_t>(opts.max_untracked_bytes);
    acquire_options.untracked.binary_check_bytes = static_cast<std::size_t>(opts.binary_check_bytes);
    diffreview::GitDiffSource source{acquire_options};

    diffreview::SessionOptions session_options;
    session_options.projection.wrap_width = wrap_width;
    session_options.projection.tab_width = std::max<int64_t>(opts.tab_width, 1);
    session_options.row_height = opts.row_height;
    session_options.comment_box.line_height = opts.comment_line_height;
    session_options.comment_box.padding = opts.comment_padding;
    session_options.comment_box.button_height = opts.comment_button_height;

    diffreview::ReviewSession session{source, session_options};
    const bool acquired = session.load(opts.repo_root);

    int exit_code = acquired ? 0 : 1;

    for (const auto& path : opts.collapse) {
        const auto& files = session.files();
        auto it = std::find_if(files.begin(), files.end(),
                               [&](const diffreview::DiffFile& file) { return file.path == path; });
        if (it == files.end()) {
            diffreview::log_warning("no changes in '{}' to collapse", path);
            continue;
        }
        session.set_collapsed(static_cast<std::size_t>(it - files.begin()), true);
    }

    // Highest index first so the others keep their meaning.
    std::sort(opts.remove.begin(), opts.remove.end(), std::greater<std::size_t>());
    opts.remove.erase(std::unique(opts.remove.begin(), opts.remove.end()), opts.remove.end());
    for (auto index : opts.remove) {
        if (!session.remove_comment(index)) {
            diffreview::log_error("no comment with index {}", index);
            exit_code = 1;
        }
    }

    for (const auto& [row, text] : opts.add) {
        if (!session.add_or_update_comment(row, text)) {
            diffreview::log_error("row {} can't carry a comment", row);
            exit_code = 1;
        }
    }

    if (opts.send) {
        diffreview::PipeAgentSink sink;
        const auto unsent = session.comments().unsent_count();
        if (session.send_to_agent(sink, opts.agent_command)) {
            fmt::print("sent {} comments\n", unsent);
        } else if (unsent > 0) {
            exit_code = 1;
        } else {
            fmt::print("no unsent comments\n");
        }
    }

    if (opts.list) {
        list_comments(session);
    } else if (!opts.send) {
        RowPrinter{session, diffreview::tty_is_interactive()}.print();
    }

    session.hide();
    return exit_code;
}
