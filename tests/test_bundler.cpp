#include <catch2/catch.hpp>

#include "bundler.hpp"
#include "naming.hpp"

#include <random>

static constexpr std::uint64_t MB = 1024ull * 1024;

static ArchiveUnit unit(const std::string& label, std::uint64_t size) {
    ArchiveUnit u;
    u.path = "/tmp/" + label + ".zip";
    u.sizeBytes = size;
    u.sourceChapter.chapterLabel = label;
    return u;
}

TEST_CASE("bundler groups greedily under the cap") {
    auto bundles = Bundler::pack({unit("1", 10 * MB), unit("2", 10 * MB), unit("3", 10 * MB), unit("4", 30 * MB)}, 25 * MB);

    REQUIRE(bundles.size() == 3);
    REQUIRE(bundles[0].members.size() == 2);
    REQUIRE(bundles[0].totalSizeBytes == 20 * MB);
    REQUIRE(bundles[1].members.size() == 1);
    REQUIRE(bundles[1].members[0].sourceChapter.chapterLabel == "3");
    REQUIRE(bundles[2].members.size() == 1);
    REQUIRE(bundles[2].totalSizeBytes == 30 * MB);
}

TEST_CASE("bundler accepts an exact fit and handles empty input") {
    auto bundles = Bundler::pack({unit("1", 15), unit("2", 10), unit("3", 1)}, 25);
    REQUIRE(bundles.size() == 2);
    REQUIRE(bundles[0].totalSizeBytes == 25);

    REQUIRE(Bundler::pack({}, 25).empty());
}

TEST_CASE("bundler respects the cap and preserves order for random sizes") {
    std::mt19937 rng(42);
    for (int round = 0; round < 20; ++round) {
        const std::uint64_t cap = 50 + rng() % 100;
        std::vector<ArchiveUnit> units;
        const int n = 1 + static_cast<int>(rng() % 40);
        for (int i = 0; i < n; ++i) units.push_back(unit(std::to_string(i), 1 + rng() % 180));

        auto bundles = Bundler::pack(units, cap);

        std::vector<std::string> flattened;
        for (const auto& b : bundles) {
            REQUIRE_FALSE(b.members.empty());
            std::uint64_t sum = 0;
            for (const auto& m : b.members) {
                sum += m.sizeBytes;
                flattened.push_back(m.sourceChapter.chapterLabel);
            }
            REQUIRE(sum == b.totalSizeBytes);
            if (b.members.size() > 1) REQUIRE(b.totalSizeBytes <= cap);
        }
        REQUIRE(flattened.size() == units.size());
        for (std::size_t i = 0; i < units.size(); ++i) REQUIRE(flattened[i] == units[i].sourceChapter.chapterLabel);
    }
}

TEST_CASE("incremental add and finish match pack") {
    Bundler b(25);
    b.add(unit("1", 10));
    b.add(unit("2", 20));
    auto first = b.finish();
    REQUIRE(first.size() == 2);
    REQUIRE(b.finish().empty());
}

TEST_CASE("bundle names carry the padded chapter range") {
    Bundle range;
    range.members = {unit("1", 1), unit("12.5", 1)};
    REQUIRE(Bundler::bundle_name("My: Series", range) == "My_ Series Ch.0001-0012.5.zip");

    Bundle single;
    single.members = {unit("3", 1)};
    REQUIRE(Bundler::bundle_name("S", single) == "S Ch.0003.zip");
}

TEST_CASE("long series titles are shortened without losing the chapter range") {
    const std::string title(130, 'T');
    Bundle a;
    a.members = {unit("1", 1)};
    Bundle b;
    b.members = {unit("2", 1), unit("4", 1)};

    const auto nameA = Bundler::bundle_name(title, a);
    const auto nameB = Bundler::bundle_name(title, b);

    REQUIRE(nameA != nameB);
    REQUIRE(nameA == std::string(92, 'T') + " Ch.0001.zip");
    REQUIRE(nameB == std::string(87, 'T') + " Ch.0002-0004.zip");
    REQUIRE(nameB.size() == kMaxFileNameLength + 4);
}
