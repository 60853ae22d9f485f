#include "readlines.hpp"

#include <cerrno>

using namespace diffreview;

namespace {

std::string_view
strip_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace

bool
diffreview::getline(LineCursor& cursor, std::string_view& line) {
    if (cursor.done) {
        return false;
    }

    if (cursor.pos >= cursor.source.size()) {
        cursor.done = true;
        return false;
    }

    auto end = cursor.source.find('\n', cursor.pos);
    if (end == std::string_view::npos) {
        line = strip_cr(cursor.source.substr(cursor.pos));
        cursor.pos = cursor.source.size();
        cursor.missing_final_newline = true;
        cursor.done = true;
        return true;
    }

    line = strip_cr(cursor.source.substr(cursor.pos, end - cursor.pos));
    cursor.pos = end + 1;
    return true;
}

std::vector<std::string_view>
diffreview::splitlines(std::string_view text, bool* missing_final_newline) {
    std::vector<std::string_view> lines;
    LineCursor cursor{text};
    std::string_view line;
    while (diffreview::getline(cursor, line)) {
        lines.push_back(line);
    }
    if (missing_final_newline) {
        *missing_final_newline = cursor.missing_final_newline;
    }
    return lines;
}

std::string
diffreview::to_string(ReadStatus status) {
    switch (status) {
        case ReadStatus::kOk:
            return "Success";
        case ReadStatus::kCannotOpen:
            return "File could not be opened";
        case ReadStatus::kReadError:
            return "Read error";
        case ReadStatus::kTooLarge:
            return "File too large";
        default:
            return "Unknown error";
    }
}

ReadStatus
diffreview::read_stream(FILE* stream, std::size_t max_bytes, std::string& out) {
    out.clear();

    char buffer[64 * 1024];
    while (true) {
        std::size_t n = fread(buffer, 1, sizeof(buffer), stream);
        if (n > 0) {
            if (out.size() + n > max_bytes) {
                out.append(buffer, max_bytes - out.size());
                return ReadStatus::kTooLarge;
            }
            out.append(buffer, n);
        }
        if (n < sizeof(buffer)) {
            if (ferror(stream)) {
                return ReadStatus::kReadError;
            }
            break;
        }
    }
    return ReadStatus::kOk;
}

ReadStatus
diffreview::read_file(const std::string& path, std::size_t max_bytes, std::string& out) {
    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        out.clear();
        return ReadStatus::kCannotOpen;
    }

    auto status = read_stream(stream, max_bytes, out);
    fclose(stream);
    return status;
}

ReadStatus
diffreview::read_file_head(const std::string& path, std::size_t count, std::string& out) {
    out.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        return ReadStatus::kCannotOpen;
    }

    out.resize(count);
    std::size_t n = fread(out.data(), 1, count, stream);
    out.resize(n);

    bool failed = n < count && ferror(stream);
    fclose(stream);
    return failed ? ReadStatus::kReadError : ReadStatus::kOk;
}

std::error_code
diffreview::write_file(const std::string& path, std::string_view contents) {
    FILE* stream = fopen(path.c_str(), "wb");
    if (!stream) {
        return std::error_code(errno, std::generic_category());
    }

    std::error_code ec;
    if (fwrite(contents.data(), 1, contents.size(), stream) != contents.size()) {
        ec = std::error_code(errno, std::generic_category());
    }
    if (fclose(stream) != 0 && !ec) {
        ec = std::error_code(errno, std::generic_category());
    }
    return ec;
}
