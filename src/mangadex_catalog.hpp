#pragma once

#include "catalog.hpp"

#include <chrono>
#include <string>

struct MangaDexOptions {
    std::string apiBase = "https://api.mangadex.org";
    int timeoutMs = 30000;
    std::string userAgent = "mangarelay/1.0";
    std::string coverBase = "https://uploads.mangadex.org";
};

class MangaDexCatalog : public Catalog {
public:
    explicit MangaDexCatalog(MangaDexOptions options);

    CallResult<SeriesInfo> fetch_series(const std::string& seriesId) override;
    CallResult<FeedPage> fetch_feed_page(const std::string& seriesId,
                                         const std::vector<std::string>& languages,
                                         int limit,
                                         int offset) override;
    CallResult<std::vector<PageAsset>> fetch_pages(const std::string& chapterId, bool dataSaver) override;
    CallResult<std::vector<std::string>> fetch_artwork(const std::string& seriesId, int limit) override;

    // Response parsers, independent of the transport.
    // /manga/{id} with author, artist and cover_art relationships expanded.
    static CallResult<SeriesInfo> parse_series(const std::string& body, const std::string& coverBase);
    // /cover listing; URLs point at the full-size files.
    static CallResult<std::vector<std::string>> parse_covers(const std::string& body,
                                                            const std::string& seriesId,
                                                            const std::string& coverBase);
    static CallResult<FeedPage> parse_feed(const std::string& body);
    static CallResult<std::vector<PageAsset>> parse_at_home(const std::string& body, bool dataSaver);

    // X-RateLimit-Retry-After is an epoch timestamp in seconds, Retry-After a delay.
    static std::chrono::milliseconds retry_after_from(const std::string& rateLimitRetryAfter,
                                                      const std::string& retryAfter,
                                                      long long nowEpochSeconds);

private:
    MangaDexOptions opts_;

    template <class T, class Parser>
    CallResult<T> get(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params, Parser parse);
};
