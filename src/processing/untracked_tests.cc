#include "processing/untracked.hpp"
#include "processing/diff_parser.hpp"
#include "util/readlines.hpp"

#include <doctest.h>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using namespace diffreview;

namespace {

void
put_file(const fs::path& path, const std::string& contents) {
    REQUIRE_FALSE(write_file(path.string(), contents));
}

}  // namespace

TEST_CASE("untracked") {
    SUBCASE("new_file_text") {
        auto text = synthesize_new_file_diff("notes.md", "one\ntwo\n");
        REQUIRE(text == "diff --git a/notes.md b/notes.md\n"
                        "new file mode 100644\n"
                        "--- /dev/null\n"
                        "+++ b/notes.md\n"
                        "@@ -0,0 +1,2 @@\n"
                        "+one\n"
                        "+two\n");
    }

    SUBCASE("missing_final_newline") {
        auto text = synthesize_new_file_diff("a", "x");
        REQUIRE(text.find("@@ -0,0 +1,1 @@\n+x\n\\ No newline at end of file\n") != std::string::npos);
    }

    SUBCASE("empty_file_has_no_hunk") {
        auto text = synthesize_new_file_diff("empty", "");
        REQUIRE(text.find("@@") == std::string::npos);

        auto files = parse_diff(text);
        REQUIRE(files.size() == 1);
        REQUIRE(files[0].path == "empty");
        REQUIRE(files[0].hunks.empty());
    }

    SUBCASE("parses_as_added_lines") {
        auto files = parse_diff(synthesize_new_file_diff("dir/f.txt", "alpha\n\nomega"));
        REQUIRE(files.size() == 1);
        REQUIRE(files[0].path == "dir/f.txt");
        REQUIRE(files[0].hunks.size() == 1);

        const auto& lines = files[0].hunks[0].lines;
        REQUIRE(lines.size() == 3);
        CHECK(lines[0].kind == LineKind::Add);
        CHECK(lines[0].new_line_number == 1);
        CHECK(lines[1].text.empty());
        CHECK(lines[2].text == "omega");
        CHECK(lines[2].new_line_number == 3);
    }

    SUBCASE("binary_detection") {
        CHECK(looks_binary(std::string("ab\0cd", 5)));
        CHECK_FALSE(looks_binary("abcd"));
    }
}

TEST_CASE("untracked_from_disk") {
    fs::path root = fs::temp_directory_path() / "diffreview_untracked_test";
    fs::remove_all(root);
    fs::create_directories(root / "sub");

    put_file(root / "sub" / "text.txt", "hello\nworld\n");
    put_file(root / "blob.bin", std::string("PK\0\3", 4));
    put_file(root / "big.txt", std::string(64, 'x') + "\n");

    UntrackedOptions options;
    options.max_file_bytes = 32;

    auto text = synthesize_untracked_diff(
        root.string(), {"sub/text.txt", "blob.bin", "big.txt", "missing.txt"}, options);
    auto files = parse_diff(text);

    REQUIRE(files.size() == 3);

    CHECK(files[0].path == "sub/text.txt");
    REQUIRE(files[0].hunks.size() == 1);
    CHECK(files[0].hunks[0].lines.size() == 2);

    CHECK(files[1].path == "blob.bin");
    REQUIRE(files[1].hunks.size() == 1);
    REQUIRE(files[1].hunks[0].lines.size() == 1);
    CHECK(files[1].hunks[0].lines[0].text == "(binary file not shown)");

    CHECK(files[2].path == "big.txt");
    REQUIRE(files[2].hunks[0].lines.size() == 1);
    CHECK(files[2].hunks[0].lines[0].text == "(file too large to show: 65 bytes)");

    fs::remove_all(root);
}
