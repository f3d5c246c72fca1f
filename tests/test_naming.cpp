#include <catch2/catch.hpp>

#include "naming.hpp"

TEST_CASE("sanitize_filename replaces reserved characters and caps length") {
    REQUIRE(sanitize_filename(" a/b\\c:d*e?f\"g<h>i|j ") == "a_b_c_d_e_f_g_h_i_j");
    REQUIRE(sanitize_filename(std::string(300, 'x')).size() == 100);
}

TEST_CASE("pad_chapter pads the integer part") {
    REQUIRE(pad_chapter("1") == "0001");
    REQUIRE(pad_chapter("7.5") == "0007.5");
    REQUIRE(pad_chapter("12345") == "12345");
}

TEST_CASE("chapter directories carry number and title") {
    ChapterRef ch;
    ch.chapterLabel = "3";
    REQUIRE(chapter_dir_name(ch) == "Ch.0003");
    ch.title = "The Return?";
    REQUIRE(chapter_dir_name(ch) == "Ch.0003 - The Return_");
}

TEST_CASE("page file names use the ordinal and the URL extension") {
    REQUIRE(page_file_name(1, "https://cdn/data/h/x1-abc.png") == "001.png");
    REQUIRE(page_file_name(12, "https://cdn/data/h/x12.jpg?token=1") == "012.jpg");
    REQUIRE(page_file_name(3, "https://cdn/data/h/noext") == "003.jpg");
    REQUIRE(page_file_name(1000, "https://cdn/a.webp") == "1000.webp");
}

TEST_CASE("extract_uuid finds the id in catalog URLs") {
    REQUIRE(extract_uuid("https://mangadex.org/title/a1c7c817-4e59-43b7-9365-09675a149a6f/one-piece") ==
            "a1c7c817-4e59-43b7-9365-09675a149a6f");
    REQUIRE(extract_uuid("  A1C7C817-4E59-43B7-9365-09675A149A6F ") == "A1C7C817-4E59-43B7-9365-09675A149A6F");
    REQUIRE(extract_uuid("  plain-id ") == "plain-id");
}
