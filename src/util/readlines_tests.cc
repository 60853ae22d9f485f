#include "util/readlines.hpp"

#include <doctest.h>

#include <cstdio>
#include <filesystem>
#include <string>

using namespace diffreview;

TEST_CASE("readlines") {
    SUBCASE("just_text") {
        std::string s = "öl\nbål\nskur";
        bool missing_newline = false;
        auto lines = diffreview::splitlines(s, &missing_newline);

        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0] == "öl");
        REQUIRE(lines[1] == "bål");
        REQUIRE(lines[2] == "skur");
        REQUIRE(missing_newline);
    }

    SUBCASE("trailing_newline") {
        bool missing_newline = true;
        auto lines = diffreview::splitlines("a\nb\n", &missing_newline);
        REQUIRE(lines.size() == 2);
        REQUIRE_FALSE(missing_newline);
    }

    SUBCASE("carriage_returns") {
        auto lines = diffreview::splitlines("a\r\nb\r\nc\r");
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0] == "a");
        REQUIRE(lines[1] == "b");
        REQUIRE(lines[2] == "c");
    }

    SUBCASE("empty_lines") {
        auto lines = diffreview::splitlines("\n\nx\n");
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0].empty());
        REQUIRE(lines[1].empty());
        REQUIRE(lines[2] == "x");
    }

    SUBCASE("empty_input") {
        REQUIRE(diffreview::splitlines("").empty());
    }
}

TEST_CASE("read_file") {
    auto path = (std::filesystem::temp_directory_path() / "diffreview_readlines_test.txt").string();
    {
        FILE* f = fopen(path.c_str(), "wb");
        REQUIRE(f != nullptr);
        fputs("0123456789", f);
        fclose(f);
    }

    SUBCASE("whole") {
        std::string out;
        REQUIRE(read_file(path, 100, out) == ReadStatus::kOk);
        REQUIRE(out == "0123456789");
    }

    SUBCASE("exact_limit") {
        std::string out;
        REQUIRE(read_file(path, 10, out) == ReadStatus::kOk);
        REQUIRE(out.size() == 10);
    }

    SUBCASE("too_large") {
        std::string out;
        REQUIRE(read_file(path, 4, out) == ReadStatus::kTooLarge);
        REQUIRE(out == "0123");
    }

    SUBCASE("head") {
        std::string out;
        REQUIRE(read_file_head(path, 3, out) == ReadStatus::kOk);
        REQUIRE(out == "012");
    }

    SUBCASE("missing") {
        std::string out;
        REQUIRE(read_file(path + ".missing", 10, out) == ReadStatus::kCannotOpen);
    }

    std::filesystem::remove(path);
}

TEST_CASE("write_file") {
    auto dir = std::filesystem::temp_directory_path() / "diffreview_write_file_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    auto path = (dir / "out.txt").string();

    REQUIRE_FALSE(write_file(path, "first version, longer"));
    REQUIRE_FALSE(write_file(path, "second"));

    std::string out;
    REQUIRE(read_file(path, 100, out) == ReadStatus::kOk);
    CHECK(out == "second");

    CHECK(write_file((dir / "missing" / "out.txt").string(), "x"));

    std::filesystem::remove_all(dir);
}
