#pragma once

#include "archiver.hpp"
#include "catalog.hpp"
#include "destination.hpp"
#include "page_fetcher.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace testing_support {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("mangarelay_test_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_file(const fs::path& p, const std::string& data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::string pattern_bytes(std::size_t n, unsigned seed = 7) {
    std::string s(n, '\0');
    std::mt19937 rng(seed);
    for (auto& c : s) c = static_cast<char>(rng() & 0xFF);
    return s;
}

// Records sleeps instead of sleeping.
struct SleepRecorder {
    std::mutex mtx;
    std::vector<std::chrono::milliseconds> sleeps;

    std::function<void(std::chrono::milliseconds)> fn() {
        return [this](std::chrono::milliseconds d) {
            std::lock_guard<std::mutex> lk(mtx);
            sleeps.push_back(d);
        };
    }
    std::chrono::milliseconds total() {
        std::lock_guard<std::mutex> lk(mtx);
        std::chrono::milliseconds t{0};
        for (auto d : sleeps) t += d;
        return t;
    }
};

// Manual steady clock. Its sleeper advances time instead of blocking.
struct FakeClock {
    std::mutex mtx;
    std::chrono::steady_clock::time_point current{};
    std::vector<std::chrono::milliseconds> sleeps;

    std::function<std::chrono::steady_clock::time_point()> now_fn() {
        return [this] {
            std::lock_guard<std::mutex> lk(mtx);
            return current;
        };
    }
    std::function<void(std::chrono::milliseconds)> sleeper() {
        return [this](std::chrono::milliseconds d) {
            std::lock_guard<std::mutex> lk(mtx);
            sleeps.push_back(d);
            current += d;
        };
    }
    void advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lk(mtx);
        current += d;
    }
};

struct SentDocument {
    std::string fileName;
    std::string caption;
    std::string content;
    std::optional<long long> replyTo;
};

// Scripted destination. Documents get the queued responses in order, then Ok.
class FakeDestination : public Destination {
public:
    std::mutex mtx;
    std::deque<CallResult<long long>> documentScript;
    std::deque<CallResult<long long>> textScript;
    std::deque<CallResult<long long>> photoScript;
    std::vector<SentDocument> documents;
    std::vector<SentDocument> photos;
    std::vector<std::string> texts;
    std::vector<std::optional<long long>> textReplies;
    std::vector<std::pair<long long, std::string>> edits;
    int documentCalls = 0;
    long long nextId = 100;

    CallResult<long long> send_text(const std::string& text, std::optional<long long> replyTo) override {
        std::lock_guard<std::mutex> lk(mtx);
        texts.push_back(text);
        textReplies.push_back(replyTo);
        if (!textScript.empty()) {
            auto r = textScript.front();
            textScript.pop_front();
            return r;
        }
        return make_ok(nextId++);
    }

    CallResult<long long> send_document(const std::string& filePath,
                                        const std::string& fileName,
                                        const std::string& caption,
                                        std::optional<long long> replyTo) override {
        std::lock_guard<std::mutex> lk(mtx);
        ++documentCalls;
        if (!documentScript.empty()) {
            auto r = documentScript.front();
            documentScript.pop_front();
            if (!is_ok(r)) return r;
        }
        documents.push_back(SentDocument{fileName, caption, read_file(filePath), replyTo});
        return make_ok(nextId++);
    }

    CallResult<long long> send_photo(const std::string& filePath,
                                     const std::string& caption,
                                     std::optional<long long> replyTo) override {
        std::lock_guard<std::mutex> lk(mtx);
        if (!photoScript.empty()) {
            auto r = photoScript.front();
            photoScript.pop_front();
            if (!is_ok(r)) return r;
        }
        photos.push_back(SentDocument{fs::path(filePath).filename().string(), caption, read_file(filePath), replyTo});
        return make_ok(nextId++);
    }

    void edit_text(long long messageId, const std::string& text) override {
        std::lock_guard<std::mutex> lk(mtx);
        edits.emplace_back(messageId, text);
    }
};

// In-memory catalog: feed rows, series info, artwork and page lists keyed by chapter id.
class FakeCatalog : public Catalog {
public:
    std::optional<CallResult<SeriesInfo>> seriesResult;
    SeriesInfo info = default_info();
    std::vector<std::string> artworkUrls;
    int artworkCalls = 0;
    std::vector<ChapterDescriptor> rows;
    std::map<std::string, std::vector<PageAsset>> pages;
    std::deque<CallResult<std::vector<PageAsset>>> pageScript;
    std::vector<int> feedOffsets;
    std::vector<std::vector<std::string>> feedLanguages;
    int pageCalls = 0;

    static SeriesInfo default_info() {
        SeriesInfo i;
        i.id = "series-1";
        i.title = "Test Series";
        return i;
    }

    CallResult<SeriesInfo> fetch_series(const std::string&) override {
        if (seriesResult) return *seriesResult;
        return make_ok(info);
    }

    CallResult<std::vector<std::string>> fetch_artwork(const std::string&, int limit) override {
        ++artworkCalls;
        std::vector<std::string> out(artworkUrls.begin(),
                                     artworkUrls.begin() + std::min<std::size_t>(artworkUrls.size(), static_cast<std::size_t>(limit)));
        return make_ok(std::move(out));
    }

    CallResult<FeedPage> fetch_feed_page(const std::string&,
                                         const std::vector<std::string>& languages,
                                         int limit,
                                         int offset) override {
        feedOffsets.push_back(offset);
        feedLanguages.push_back(languages);
        FeedPage page;
        page.total = static_cast<int>(rows.size());
        for (int i = offset; i < offset + limit && i < static_cast<int>(rows.size()); ++i) page.rows.push_back(rows[i]);
        return make_ok(std::move(page));
    }

    CallResult<std::vector<PageAsset>> fetch_pages(const std::string& chapterId, bool) override {
        ++pageCalls;
        if (!pageScript.empty()) {
            auto r = pageScript.front();
            pageScript.pop_front();
            return r;
        }
        auto it = pages.find(chapterId);
        if (it == pages.end()) return permanent_failure(ErrorKind::PartialChapter, "unknown chapter " + chapterId);
        return make_ok(it->second);
    }
};

// Writes a deterministic body per URL. URLs containing "fail" never succeed.
class FakeFetcher : public PageFetcher {
public:
    std::size_t bytesPerPage = 1024;
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> calls{0};
    std::chrono::milliseconds delay{0};

    CallResult<std::uint64_t> fetch(const std::string& url, const std::string& destPath) override {
        ++calls;
        int now = ++active;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        --active;

        if (url.find("fail") != std::string::npos) return permanent_failure(ErrorKind::PartialChapter, "HTTP 404 for " + url);
        write_file(destPath, pattern_bytes(bytesPerPage, static_cast<unsigned>(std::hash<std::string>{}(url))));
        return make_ok<std::uint64_t>(bytesPerPage);
    }
};

// "<dir>.zip" holding the concatenation of the directory's files in name order.
class ConcatArchiver : public Archiver {
public:
    int calls = 0;

    CallResult<ArchiveResult> create_archive(const std::string& sourceDir) override {
        ++calls;
        std::vector<fs::path> files;
        for (const auto& e : fs::directory_iterator(sourceDir)) {
            if (e.is_regular_file()) files.push_back(e.path());
        }
        std::sort(files.begin(), files.end());
        std::string blob;
        for (const auto& f : files) blob += read_file(f);
        const std::string out = fs::path(sourceDir).string() + ".zip";
        write_file(out, blob);
        return make_ok(ArchiveResult{out, static_cast<std::uint64_t>(blob.size())});
    }
};

}  // namespace testing_support
