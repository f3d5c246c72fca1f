#include <catch2/catch.hpp>

#include "resilient_sender.hpp"
#include "test_support.hpp"

using namespace std::chrono;
using namespace testing_support;

namespace {

struct SenderFixture {
    TempDir tmp;
    FakeDestination dest;
    SleepRecorder retrySleeps;
    SleepRecorder pauseSleeps;
    RetryPolicy policy{4, RetryPolicy::exponential(milliseconds(1000), milliseconds(30000)), retrySleeps.fn()};

    Artifact make_artifact(const std::string& name, std::size_t size) {
        const auto p = tmp.path() / name;
        write_file(p, pattern_bytes(size, static_cast<unsigned>(size)));
        return Artifact{p.string(), name, size};
    }

    ResilientSender sender(std::uint64_t limit, std::uint64_t chunk) {
        SenderOptions o;
        o.destinationLimitBytes = limit;
        o.chunkBytes = chunk;
        o.partPause = milliseconds(1000);
        o.partDir = (tmp.path() / "parts").string();
        return ResilientSender(dest, policy, o, pauseSleeps.fn());
    }
};

}  // namespace

TEST_CASE("rate-limited twice then accepted: three attempts and at least ten seconds of waiting") {
    SenderFixture f;
    f.dest.documentScript = {RateLimited{seconds(5), "429"}, RateLimited{seconds(5), "429"}};
    auto s = f.sender(1 << 20, 1 << 19);

    auto out = s.send(f.make_artifact("a.zip", 100), 42);

    REQUIRE(out.success);
    REQUIRE(out.attempts == 3);
    REQUIRE(f.dest.documentCalls == 3);
    REQUIRE(f.retrySleeps.total() >= seconds(10));
    REQUIRE(f.dest.documents.size() == 1);
    REQUIRE(f.dest.documents[0].replyTo == 42);
}

TEST_CASE("small artifacts go out in one piece with a size caption") {
    SenderFixture f;
    auto s = f.sender(1 << 20, 1 << 19);
    auto artifact = f.make_artifact("Series Ch.0001-0002.zip", 2048);

    auto out = s.send(artifact, std::nullopt);

    REQUIRE(out.success);
    REQUIRE(out.attempts == 1);
    REQUIRE(out.messageId == 100);
    REQUIRE(f.dest.documents.size() == 1);
    REQUIRE(f.dest.documents[0].fileName == "Series Ch.0001-0002.zip");
    REQUIRE(f.dest.documents[0].caption.find("Series Ch.0001-0002.zip") == 0);
    REQUIRE(f.dest.documents[0].content == read_file(artifact.path));
    REQUIRE(f.pauseSleeps.sleeps.empty());
}

TEST_CASE("oversize artifacts are split into numbered parts that reassemble") {
    SenderFixture f;
    const std::size_t KB = 1024;
    auto s = f.sender(100 * KB, 45 * KB);
    auto artifact = f.make_artifact("big.zip", 120 * KB);

    auto out = s.send(artifact, 7);

    REQUIRE(out.success);
    REQUIRE(out.attempts == 3);
    REQUIRE(f.dest.documents.size() == 3);
    REQUIRE(f.dest.documents[0].fileName == "big.zip (Part 1/3)");
    REQUIRE(f.dest.documents[1].fileName == "big.zip (Part 2/3)");
    REQUIRE(f.dest.documents[2].fileName == "big.zip (Part 3/3)");
    REQUIRE(f.dest.documents[0].content.size() == 45 * KB);
    REQUIRE(f.dest.documents[1].content.size() == 45 * KB);
    REQUIRE(f.dest.documents[2].content.size() == 30 * KB);

    std::string joined;
    for (const auto& d : f.dest.documents) joined += d.content;
    REQUIRE(joined == read_file(artifact.path));

    // pause between parts, not after the last
    REQUIRE(f.pauseSleeps.sleeps.size() == 2);
    REQUIRE(fs::is_empty(f.tmp.path() / "parts"));
}

TEST_CASE("a failed part aborts the whole artifact") {
    SenderFixture f;
    f.dest.documentScript = {make_ok<long long>(1), permanent_failure(ErrorKind::BadRequest, "HTTP 400 file is too big")};
    auto s = f.sender(900, 400);

    auto out = s.send(f.make_artifact("x.zip", 1000), std::nullopt);

    REQUIRE_FALSE(out.success);
    REQUIRE(out.failureKind == ErrorKind::BadRequest);
    REQUIRE(f.dest.documentCalls == 2);
    REQUIRE(out.attempts == 2);
    REQUIRE(fs::is_empty(f.tmp.path() / "parts"));
}

TEST_CASE("exhausted transient failures become a recorded permanent failure") {
    SenderFixture f;
    for (int i = 0; i < 4; ++i) f.dest.documentScript.push_back(transient_failure("timeout"));
    auto s = f.sender(1 << 20, 1 << 19);

    auto out = s.send(f.make_artifact("t.zip", 10), std::nullopt);

    REQUIRE_FALSE(out.success);
    REQUIRE(out.attempts == 4);
    REQUIRE(out.failureKind == ErrorKind::PermanentDelivery);
    REQUIRE(f.retrySleeps.sleeps == std::vector<milliseconds>{milliseconds(1000), milliseconds(2000), milliseconds(4000)});
}

TEST_CASE("send_text retries and returns the message id") {
    SenderFixture f;
    f.dest.textScript = {transient_failure("reset")};
    auto s = f.sender(1 << 20, 1 << 19);
    auto id = s.send_text("hello", std::nullopt);
    REQUIRE(id.has_value());
    REQUIRE(f.dest.texts.size() == 2);
}

TEST_CASE("send_photo waits out a rate limit and threads the reply") {
    SenderFixture f;
    f.dest.photoScript = {RateLimited{seconds(1), "429"}};
    auto art = f.make_artifact("cover.jpg", 2048);
    auto s = f.sender(1 << 20, 1 << 19);

    auto id = s.send_photo(art.path, "Artwork 1/1", 42);

    REQUIRE(id.value_or(0) == 100);
    REQUIRE(f.dest.photos.size() == 1);
    REQUIRE(f.dest.photos[0].caption == "Artwork 1/1");
    REQUIRE(f.dest.photos[0].replyTo.value_or(0) == 42);
    REQUIRE(f.retrySleeps.sleeps == std::vector<milliseconds>{milliseconds(1000)});
}

TEST_CASE("send_photo gives up on a rejected image") {
    SenderFixture f;
    f.dest.photoScript = {permanent_failure(ErrorKind::BadRequest, "HTTP 400 PHOTO_INVALID_DIMENSIONS")};
    auto art = f.make_artifact("wide.png", 512);
    auto s = f.sender(1 << 20, 1 << 19);

    REQUIRE_FALSE(s.send_photo(art.path, "", std::nullopt).has_value());
    REQUIRE(f.dest.photos.empty());
    REQUIRE(f.retrySleeps.sleeps.empty());
}
