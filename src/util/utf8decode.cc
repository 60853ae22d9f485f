#include "utf8decode.hpp"

using namespace diffreview;

std::size_t
diffreview::utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

std::size_t
diffreview::utf8_next(std::string_view s, std::size_t pos) {
    if (pos >= s.size()) {
        return s.size();
    }

    const auto lead = static_cast<unsigned char>(s[pos]);
    std::size_t next = pos + 1;

    // Only step over bytes that really are continuations; a truncated sequence ends
    // where the next non-continuation byte begins.
    const std::size_t expected = utf8_sequence_length(lead);
    for (std::size_t i = 1; i < expected && next < s.size(); i++) {
        if (!utf8_is_continuation(static_cast<unsigned char>(s[next]))) {
            break;
        }
        next++;
    }
    return next;
}

bool
diffreview::utf8_is_valid(std::string_view s) {
    std::size_t pos = 0;
    while (pos < s.size()) {
        const auto lead = static_cast<unsigned char>(s[pos]);
        if (lead < 0x80) {
            pos++;
            continue;
        }
        // C0, C1 and F5..FF never start a valid sequence.
        if (lead < 0xC2 || lead > 0xF4) {
            return false;
        }

        const std::size_t length = utf8_sequence_length(lead);
        if (pos + length > s.size()) {
            return false;
        }

        // Range of the second byte; it rules out overlongs, surrogates and > U+10FFFF.
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead == 0xE0) {
            low = 0xA0;
        } else if (lead == 0xED) {
            high = 0x9F;
        } else if (lead == 0xF0) {
            low = 0x90;
        } else if (lead == 0xF4) {
            high = 0x8F;
        }

        const auto second = static_cast<unsigned char>(s[pos + 1]);
        if (second < low || second > high) {
            return false;
        }
        for (std::size_t i = 2; i < length; i++) {
            if (!utf8_is_continuation(static_cast<unsigned char>(s[pos + i]))) {
                return false;
            }
        }
        pos += length;
    }
    return true;
}

int64_t
diffreview::utf8_unit_width(std::string_view s, std::size_t pos, int64_t tab_width) {
    const auto c = static_cast<unsigned char>(s[pos]);
    if (c == '\t') {
        return tab_width;
    }
    if (c < 0x20 || c == 0x7F) {
        return 0;
    }
    return 1;
}

int64_t
diffreview::display_width(std::string_view s, std::size_t start, std::size_t end, int64_t tab_width) {
    if (end > s.size()) {
        end = s.size();
    }
    int64_t width = 0;
    std::size_t pos = start;
    while (pos < end) {
        width += utf8_unit_width(s, pos, tab_width);
        pos = utf8_next(s, pos);
    }
    return width;
}

int64_t
diffreview::display_width(std::string_view s, int64_t tab_width) {
    return display_width(s, 0, s.size(), tab_width);
}
