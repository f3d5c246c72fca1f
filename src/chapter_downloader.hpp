#pragma once

#include "concurrency_gate.hpp"
#include "page_fetcher.hpp"
#include "retry_policy.hpp"
#include "types.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Downloads every page of one chapter in parallel. Each fetch holds a gate
// slot; download() returns only after every page reached a terminal state.
class ChapterDownloader {
public:
    ChapterDownloader(PageFetcher& fetcher, ConcurrencyGate& gate, RetryPolicy pageRetry);

    // Ok carries the number of pages written to dir; any page failure fails the chapter.
    CallResult<std::size_t> download(const std::vector<PageAsset>& pages, const std::string& dir);

private:
    PageFetcher& fetcher_;
    ConcurrencyGate& gate_;
    RetryPolicy pageRetry_;
};
