#pragma once

#include "errors.hpp"
#include "rate_limiter.hpp"
#include "retry_policy.hpp"
#include "types.hpp"

#include <string>
#include <vector>

struct FeedPage {
    std::vector<ChapterDescriptor> rows;
    int total = 0;
};

// Raw catalog endpoints. One call per method, no pacing or retries.
class Catalog {
public:
    virtual ~Catalog() = default;

    virtual CallResult<SeriesInfo> fetch_series(const std::string& seriesId) = 0;
    virtual CallResult<FeedPage> fetch_feed_page(const std::string& seriesId,
                                                 const std::vector<std::string>& languages,
                                                 int limit,
                                                 int offset) = 0;
    // dataSaver selects the reduced-bandwidth page variant.
    virtual CallResult<std::vector<PageAsset>> fetch_pages(const std::string& chapterId, bool dataSaver) = 0;
    // Image URLs of the series' cover gallery, at most limit entries.
    virtual CallResult<std::vector<std::string>> fetch_artwork(const std::string& seriesId, int limit) = 0;
};

// Paces every catalog call through the run's RateLimiter and retries it
// under the shared RetryPolicy. Series-level lookups are fatal on failure;
// page resolution failures stay with the chapter.
class CatalogClient {
public:
    static constexpr int kFeedPageSize = 100;

    CatalogClient(Catalog& catalog, RateLimiter& limiter, RetryPolicy policy);

    SeriesInfo series_info(const std::string& seriesId);
    std::vector<ChapterDescriptor> list_chapters(const std::string& seriesId,
                                                 const std::vector<std::string>& languages,
                                                 int maxRows = 0);
    CallResult<std::vector<PageAsset>> resolve_pages(const std::string& chapterId, bool dataSaver);
    // Optional extras; an empty list when the lookup fails.
    std::vector<std::string> artwork(const std::string& seriesId, int limit);

private:
    Catalog& catalog_;
    RateLimiter& limiter_;
    RetryPolicy policy_;
};
