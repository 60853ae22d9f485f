#include "comment_storage.hpp"

#include "util/log.hpp"
#include "util/readlines.hpp"
#include "util/utf8decode.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

using json = nlohmann::json;
using namespace diffreview;

namespace {

constexpr std::size_t kMaxCommentsFileBytes = 16 * 1024 * 1024;

json
to_json_entry(const DiffComment& comment) {
    json entry = json::object();
    entry["file"] = comment.key.file_path;
    entry["line"] = comment.key.line_number;
    entry["text"] = comment.text;
    return entry;
}

std::optional<DiffComment>
from_json_entry(const json& entry) {
    if (!entry.is_object()) {
        return std::nullopt;
    }

    auto file = entry.find("file");
    auto line = entry.find("line");
    auto text = entry.find("text");
    if (file == entry.end() || !file->is_string() || line == entry.end() || !line->is_number_integer() ||
        text == entry.end() || !text->is_string()) {
        return std::nullopt;
    }

    DiffComment comment;
    comment.key.file_path = file->get<std::string>();
    comment.key.line_number = line->get<int64_t>();
    comment.text = text->get<std::string>();
    if (comment.key.line_number < 0) {
        return std::nullopt;
    }
    return comment;
}

}  // namespace

std::string
diffreview::comments_file_path(const std::string& repo_root) {
    return (fs::path(repo_root) / ".architect" / "diff_comments.json").string();
}

std::string
diffreview::serialize_comments(const std::vector<DiffComment>& comments) {
    json doc = json::array();
    for (const auto& comment : comments) {
        if (comment.sent) {
            continue;
        }
        // JSON text is UTF-8; other bytes are written as U+FFFD and the saved path no
        // longer matches the diff after a reload.
        if (!utf8_is_valid(comment.key.file_path)) {
            log_warning("comment on '{}' line {}: path is not UTF-8, it will not match after reload",
                        comment.key.file_path, comment.key.line_number);
        }
        if (!utf8_is_valid(comment.text)) {
            log_warning("comment on '{}' line {}: invalid UTF-8 in text replaced", comment.key.file_path,
                        comment.key.line_number);
        }
        doc.push_back(to_json_entry(comment));
    }
    return doc.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

std::vector<DiffComment>
diffreview::deserialize_comments(std::string_view json_text) {
    std::vector<DiffComment> comments;

    json doc = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        log_warning("ignoring comments file: not a JSON array");
        return comments;
    }

    std::size_t skipped = 0;
    for (const auto& entry : doc) {
        if (auto comment = from_json_entry(entry)) {
            comments.push_back(std::move(*comment));
        } else {
            skipped++;
        }
    }
    if (skipped > 0) {
        log_debug("skipped {} malformed comment entries", skipped);
    }
    return comments;
}

std::vector<DiffComment>
diffreview::load_comments(const std::string& repo_root) {
    const auto path = comments_file_path(repo_root);

    std::string text;
    auto status = read_file(path, kMaxCommentsFileBytes, text);
    if (status == ReadStatus::kCannotOpen) {
        log_debug("no comments loaded from '{}'", path);
        return {};
    }
    if (status != ReadStatus::kOk) {
        log_warning("failed to read '{}': {}", path, to_string(status));
        return {};
    }
    return deserialize_comments(text);
}

bool
diffreview::save_comments(const std::string& repo_root, const std::vector<DiffComment>& comments) {
    const auto path = fs::path(comments_file_path(repo_root));

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        log_warning("failed to create '{}': {}", path.parent_path().string(), ec.message());
        return false;
    }

    ec = write_file(path.string(), serialize_comments(comments));
    if (ec) {
        log_warning("failed to write '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}
