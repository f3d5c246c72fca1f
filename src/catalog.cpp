#include "catalog.hpp"

#include "log.hpp"

CatalogClient::CatalogClient(Catalog& catalog, RateLimiter& limiter, RetryPolicy policy)
    : catalog_(catalog), limiter_(limiter), policy_(std::move(policy)) {
    policy_.set_rate_limit_handler([&limiter](std::chrono::milliseconds declared) {
        return limiter.honor_retry_after(declared);
    });
}

SeriesInfo CatalogClient::series_info(const std::string& seriesId) {
    auto r = policy_.run<SeriesInfo>("series lookup", [&](int) {
        limiter_.acquire();
        return catalog_.fetch_series(seriesId);
    });
    if (auto* ok = std::get_if<Ok<SeriesInfo>>(&r.result)) return ok->value;
    throw FatalError(ErrorKind::CatalogFailure, "series " + seriesId + " lookup failed: " + describe(r.result));
}

std::vector<ChapterDescriptor> CatalogClient::list_chapters(const std::string& seriesId,
                                                            const std::vector<std::string>& languages,
                                                            int maxRows) {
    std::vector<ChapterDescriptor> rows;
    int offset = 0;
    for (;;) {
        auto r = policy_.run<FeedPage>("chapter feed offset " + std::to_string(offset), [&](int) {
            limiter_.acquire();
            return catalog_.fetch_feed_page(seriesId, languages, kFeedPageSize, offset);
        });
        auto* ok = std::get_if<Ok<FeedPage>>(&r.result);
        if (!ok) {
            throw FatalError(ErrorKind::CatalogFailure, "chapter feed failed: " + describe(r.result));
        }
        const auto& page = ok->value;
        rows.insert(rows.end(), page.rows.begin(), page.rows.end());
        offset += static_cast<int>(page.rows.size());
        log_debug("CAT", "feed rows " + std::to_string(rows.size()) + "/" + std::to_string(page.total));

        if (page.rows.empty() || offset >= page.total) break;
        if (maxRows > 0 && static_cast<int>(rows.size()) >= maxRows) break;
    }
    return rows;
}

CallResult<std::vector<PageAsset>> CatalogClient::resolve_pages(const std::string& chapterId, bool dataSaver) {
    auto r = policy_.run<std::vector<PageAsset>>("pages of " + chapterId, [&](int) {
        limiter_.acquire();
        return catalog_.fetch_pages(chapterId, dataSaver);
    });
    return std::move(r.result);
}

std::vector<std::string> CatalogClient::artwork(const std::string& seriesId, int limit) {
    if (limit <= 0) return {};
    auto r = policy_.run<std::vector<std::string>>("artwork of " + seriesId, [&](int) {
        limiter_.acquire();
        return catalog_.fetch_artwork(seriesId, limit);
    });
    if (auto* ok = std::get_if<Ok<std::vector<std::string>>>(&r.result)) return ok->value;
    log_warn("CAT", "artwork lookup failed, continuing without: " + describe(r.result));
    return {};
}
