#include <catch2/catch.hpp>

#include "archiver.hpp"
#include "test_support.hpp"

#include <zip.h>

#include <set>

using namespace testing_support;

TEST_CASE("zip archives hold every page under its relative name") {
    TempDir tmp;
    const auto dir = tmp.path() / "Ch.0001 - Start";
    fs::create_directories(dir);
    write_file(dir / "001.jpg", pattern_bytes(4096, 1));
    write_file(dir / "002.png", pattern_bytes(2048, 2));
    write_file(dir / "notes.txt", std::string(1000, 'a'));

    ZipArchiver archiver;
    auto r = archiver.create_archive(dir.string());
    REQUIRE(is_ok(r));
    const auto& res = std::get<Ok<ArchiveResult>>(r).value;
    REQUIRE(res.path == dir.string() + ".zip");
    REQUIRE(res.sizeBytes == fs::file_size(res.path));

    int err = 0;
    zip_t* za = zip_open(res.path.c_str(), ZIP_RDONLY, &err);
    REQUIRE(za != nullptr);
    std::set<std::string> names;
    zip_uint64_t jpgSize = 0;
    zip_uint16_t jpgMethod = 0;
    for (zip_int64_t i = 0; i < zip_get_num_entries(za, 0); ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        REQUIRE(zip_stat_index(za, static_cast<zip_uint64_t>(i), 0, &st) == 0);
        names.insert(st.name);
        if (std::string(st.name) == "001.jpg") {
            jpgSize = st.size;
            jpgMethod = st.comp_method;
        }
    }
    zip_close(za);

    REQUIRE(names == std::set<std::string>{"001.jpg", "002.png", "notes.txt"});
    REQUIRE(jpgSize == 4096);
    REQUIRE(jpgMethod == ZIP_CM_STORE);
}

TEST_CASE("archiving a missing directory is a filesystem failure") {
    TempDir tmp;
    ZipArchiver archiver;
    auto r = archiver.create_archive((tmp.path() / "absent").string());
    REQUIRE(std::holds_alternative<Failed>(r));
    REQUIRE(std::get<Failed>(r).kind == ErrorKind::Filesystem);
}
