#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace diffreview {

// Walks a memory buffer line by line. The delimiter is not part of the returned line,
// and neither is a '\r' right before it (or at the very end of the buffer).
struct LineCursor {
    explicit LineCursor(std::string_view source_data)
        : source(source_data) {
    }

    std::string_view source;
    std::size_t pos = 0;
    bool done = false;

    // Set after the last line has been read when the buffer did not end with '\n'.
    bool missing_final_newline = false;
};

bool
getline(LineCursor& cursor, std::string_view& line);

std::vector<std::string_view>
splitlines(std::string_view text, bool* missing_final_newline = nullptr);

enum class ReadStatus {
    kOk,
    kCannotOpen,
    kReadError,
    kTooLarge,
};

std::string
to_string(ReadStatus status);

// Read everything from `stream`, giving up with kTooLarge once more than `max_bytes`
// have been seen. `out` holds what was read so far in every case.
ReadStatus
read_stream(FILE* stream, std::size_t max_bytes, std::string& out);

ReadStatus
read_file(const std::string& path, std::size_t max_bytes, std::string& out);

// Read at most `count` bytes from the start of the file.
ReadStatus
read_file_head(const std::string& path, std::size_t count, std::string& out);

// Replace the contents of `path`. Not atomic.
std::error_code
write_file(const std::string& path, std::string_view contents);

}  // namespace diffreview
