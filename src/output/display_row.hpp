#pragma once

#include <cstddef>
#include <string>
#include <variant>

namespace diffreview {

// Indices refer to the DiffFile vector the rows were projected from.

struct FileHeaderRow {
    std::size_t file = 0;

    bool operator==(const FileHeaderRow& other) const {
        return file == other.file;
    }
};

struct HunkHeaderRow {
    std::size_t file = 0;
    std::size_t hunk = 0;

    bool operator==(const HunkHeaderRow& other) const {
        return file == other.file && hunk == other.hunk;
    }
};

// One display row of a diff line. A line wider than the wrap width is split into
// several rows with increasing `byte_offset`; the row text runs from its offset to
// the next row's offset (or the end of the line).
struct DiffLineRow {
    std::size_t file = 0;
    std::size_t hunk = 0;
    std::size_t line = 0;
    std::size_t byte_offset = 0;

    bool
    same_line(const DiffLineRow& other) const {
        return file == other.file && hunk == other.hunk && line == other.line;
    }

    bool operator==(const DiffLineRow& other) const {
        return same_line(other) && byte_offset == other.byte_offset;
    }
};

struct MessageRow {
    std::string text;

    bool operator==(const MessageRow& other) const {
        return text == other.text;
    }
};

using DisplayRow = std::variant<FileHeaderRow, HunkHeaderRow, DiffLineRow, MessageRow>;

}  // namespace diffreview
