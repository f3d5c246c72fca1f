#include "chapter_downloader.hpp"

#include "log.hpp"
#include "naming.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>

namespace fs = std::filesystem;

ChapterDownloader::ChapterDownloader(PageFetcher& fetcher, ConcurrencyGate& gate, RetryPolicy pageRetry)
    : fetcher_(fetcher), gate_(gate), pageRetry_(std::move(pageRetry)) {}

CallResult<std::size_t> ChapterDownloader::download(const std::vector<PageAsset>& pages, const std::string& dir) {
    if (pages.empty()) return permanent_failure(ErrorKind::PartialChapter, "no pages to download");

    std::set<int> ordinals;
    for (const auto& p : pages) {
        if (p.ordinal < 1 || !ordinals.insert(p.ordinal).second) {
            return permanent_failure(ErrorKind::PartialChapter, "invalid or duplicate page ordinal " + std::to_string(p.ordinal));
        }
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return permanent_failure(ErrorKind::Filesystem, "mkdir " + dir + ": " + ec.message());

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> written{0};
    std::mutex errMtx;
    std::string firstError;

    auto worker = [&]() {
        for (;;) {
            const std::size_t i = next++;
            if (i >= pages.size()) break;
            const PageAsset& page = pages[i];
            const std::string dest = (fs::path(dir) / page_file_name(page.ordinal, page.url)).string();

            auto r = pageRetry_.run<std::uint64_t>("page " + std::to_string(page.ordinal), [&](int) -> CallResult<std::uint64_t> {
                ConcurrencyGate::Permit permit(gate_);
                try {
                    return fetcher_.fetch(page.url, dest);
                } catch (const std::exception& ex) {
                    return transient_failure(ex.what());
                }
            });
            if (is_ok(r.result)) {
                ++written;
            } else {
                std::lock_guard<std::mutex> lk(errMtx);
                if (firstError.empty()) firstError = "page " + std::to_string(page.ordinal) + ": " + describe(r.result);
            }
        }
    };

    const std::size_t threads = std::min(gate_.capacity(), pages.size());
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
    for (auto& t : pool) t.join();

    if (written != pages.size()) {
        return permanent_failure(ErrorKind::PartialChapter,
                                 std::to_string(pages.size() - written) + " of " + std::to_string(pages.size()) +
                                 " pages failed, first: " + firstError);
    }
    log_debug("DL", "downloaded " + std::to_string(written.load()) + " pages into " + dir);
    return make_ok<std::size_t>(written.load());
}
