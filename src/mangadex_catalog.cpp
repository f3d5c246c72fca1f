#include "mangadex_catalog.hpp"

#include "log.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>

using nlohmann::json;

MangaDexCatalog::MangaDexCatalog(MangaDexOptions options) : opts_(std::move(options)) {}

// -------------------- transport --------------------
std::chrono::milliseconds MangaDexCatalog::retry_after_from(const std::string& rateLimitRetryAfter,
                                                            const std::string& retryAfter,
                                                            long long nowEpochSeconds) {
    if (!rateLimitRetryAfter.empty()) {
        long long until = std::atoll(rateLimitRetryAfter.c_str());
        if (until > nowEpochSeconds) return std::chrono::seconds(until - nowEpochSeconds);
        if (until > 0) return std::chrono::seconds(1);
    }
    if (!retryAfter.empty()) {
        long long secs = std::atoll(retryAfter.c_str());
        if (secs > 0) return std::chrono::seconds(secs);
    }
    return std::chrono::milliseconds(0);
}

template <class T, class Parser>
CallResult<T> MangaDexCatalog::get(const std::string& url,
                                   const std::vector<std::pair<std::string, std::string>>& params,
                                   Parser parse) {
    cpr::Parameters query;
    for (const auto& kv : params) query.Add({kv.first, kv.second});

    cpr::Response r = cpr::Get(cpr::Url{url},
                               query,
                               cpr::Header{{"User-Agent", opts_.userAgent}},
                               cpr::Timeout{opts_.timeoutMs},
                               cpr::Redirect{true});
    log_debug("CAT", "GET " + url + " -> " + std::to_string(r.status_code));

    if (r.error) {
        std::string msg = r.error.message.empty() ? "transport error" : r.error.message;
        return classify_http_failure<T>(0, msg, std::chrono::milliseconds(0), {});
    }
    if (r.status_code != 200) {
        auto header = [&](const char* name) {
            auto it = r.header.find(name);
            return it == r.header.end() ? std::string() : it->second;
        };
        const long long now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        auto wait = retry_after_from(header("X-RateLimit-Retry-After"), header("Retry-After"), now);
        return classify_http_failure<T>(r.status_code, {}, wait, r.text.substr(0, 200));
    }
    return parse(r.text);
}

CallResult<SeriesInfo> MangaDexCatalog::fetch_series(const std::string& seriesId) {
    std::vector<std::pair<std::string, std::string>> params{
        {"includes[]", "author"},
        {"includes[]", "artist"},
        {"includes[]", "cover_art"},
    };
    const std::string coverBase = opts_.coverBase;
    return get<SeriesInfo>(opts_.apiBase + "/manga/" + seriesId, params,
                           [&coverBase](const std::string& body) { return parse_series(body, coverBase); });
}

CallResult<FeedPage> MangaDexCatalog::fetch_feed_page(const std::string& seriesId,
                                                      const std::vector<std::string>& languages,
                                                      int limit,
                                                      int offset) {
    std::vector<std::pair<std::string, std::string>> params{
        {"limit", std::to_string(limit)},
        {"offset", std::to_string(offset)},
        {"order[chapter]", "asc"},
    };
    for (const auto& lang : languages) params.emplace_back("translatedLanguage[]", lang);
    return get<FeedPage>(opts_.apiBase + "/manga/" + seriesId + "/feed", params, &MangaDexCatalog::parse_feed);
}

CallResult<std::vector<PageAsset>> MangaDexCatalog::fetch_pages(const std::string& chapterId, bool dataSaver) {
    return get<std::vector<PageAsset>>(opts_.apiBase + "/at-home/server/" + chapterId, {},
                                       [dataSaver](const std::string& body) { return parse_at_home(body, dataSaver); });
}

CallResult<std::vector<std::string>> MangaDexCatalog::fetch_artwork(const std::string& seriesId, int limit) {
    std::vector<std::pair<std::string, std::string>> params{
        {"manga[]", seriesId},
        {"limit", std::to_string(limit)},
        {"order[volume]", "asc"},
    };
    const std::string coverBase = opts_.coverBase;
    return get<std::vector<std::string>>(opts_.apiBase + "/cover", params,
                                         [&](const std::string& body) { return parse_covers(body, seriesId, coverBase); });
}

// -------------------- parsing --------------------
static std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// English first, then any non-empty entry of a localized string map.
static std::string localized(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return {};
    std::string en = string_or_empty(*it, "en");
    if (!en.empty()) return en;
    for (const auto& kv : it->items()) {
        if (kv.value().is_string() && !kv.value().get<std::string>().empty()) return kv.value().get<std::string>();
    }
    return {};
}

CallResult<SeriesInfo> MangaDexCatalog::parse_series(const std::string& body, const std::string& coverBase) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return permanent_failure(ErrorKind::CatalogFailure, "malformed series JSON");
    if (!j.contains("data") || !j["data"].is_object()) return permanent_failure(ErrorKind::CatalogFailure, "series JSON has no data");
    const auto& data = j["data"];
    if (!data.contains("attributes") || !data["attributes"].is_object()) {
        return permanent_failure(ErrorKind::CatalogFailure, "series JSON has no attributes");
    }
    const auto& a = data["attributes"];

    SeriesInfo info;
    info.id = string_or_empty(data, "id");
    info.title = localized(a, "title");
    if (info.title.empty()) info.title = "Unknown";
    info.description = localized(a, "description");
    if (a.contains("year") && a["year"].is_number_integer()) info.year = a["year"].get<int>();
    info.status = string_or_empty(a, "status");
    info.originalLanguage = string_or_empty(a, "originalLanguage");
    info.contentRating = string_or_empty(a, "contentRating");

    if (a.contains("tags") && a["tags"].is_array()) {
        for (const auto& tag : a["tags"]) {
            if (!tag.is_object() || !tag.contains("attributes") || !tag["attributes"].is_object()) continue;
            const auto& ta = tag["attributes"];
            const std::string name = localized(ta, "name");
            if (name.empty()) continue;
            const std::string group = string_or_empty(ta, "group");
            if (group == "genre") info.genres.push_back(name);
            else if (group == "theme") info.themes.push_back(name);
            else info.tags.push_back(name);
        }
    }

    if (data.contains("relationships") && data["relationships"].is_array()) {
        for (const auto& rel : data["relationships"]) {
            if (!rel.is_object()) continue;
            const std::string type = string_or_empty(rel, "type");
            if (!rel.contains("attributes") || !rel["attributes"].is_object()) continue;
            const auto& ra = rel["attributes"];
            if (type == "author" || type == "artist") {
                const std::string name = string_or_empty(ra, "name");
                if (name.empty()) continue;
                auto& list = type == "author" ? info.authors : info.artists;
                if (std::find(list.begin(), list.end(), name) == list.end()) list.push_back(name);
            } else if (type == "cover_art" && info.coverUrl.empty() && !info.id.empty()) {
                const std::string file = string_or_empty(ra, "fileName");
                if (!file.empty()) info.coverUrl = coverBase + "/covers/" + info.id + "/" + file;
            }
        }
    }
    return make_ok(std::move(info));
}

CallResult<std::vector<std::string>> MangaDexCatalog::parse_covers(const std::string& body,
                                                                  const std::string& seriesId,
                                                                  const std::string& coverBase) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("data") || !j["data"].is_array()) {
        return permanent_failure(ErrorKind::CatalogFailure, "malformed cover JSON");
    }
    std::vector<std::string> urls;
    for (const auto& item : j["data"]) {
        if (!item.is_object() || !item.contains("attributes") || !item["attributes"].is_object()) continue;
        const std::string file = string_or_empty(item["attributes"], "fileName");
        if (!file.empty()) urls.push_back(coverBase + "/covers/" + seriesId + "/" + file);
    }
    return make_ok(std::move(urls));
}

CallResult<FeedPage> MangaDexCatalog::parse_feed(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return permanent_failure(ErrorKind::CatalogFailure, "malformed feed JSON");
    if (!j.contains("data") || !j["data"].is_array()) return permanent_failure(ErrorKind::CatalogFailure, "feed JSON has no data array");

    FeedPage page;
    page.total = j.value("total", 0);
    for (const auto& item : j["data"]) {
        if (!item.is_object() || !item.contains("attributes")) continue;
        const auto& a = item["attributes"];
        ChapterDescriptor d;
        d.id = string_or_empty(item, "id");
        d.chapter = string_or_empty(a, "chapter");
        d.languageCode = string_or_empty(a, "translatedLanguage");
        d.title = string_or_empty(a, "title");
        d.externalOnly = !string_or_empty(a, "externalUrl").empty();
        page.rows.push_back(std::move(d));
    }
    return make_ok(std::move(page));
}

CallResult<std::vector<PageAsset>> MangaDexCatalog::parse_at_home(const std::string& body, bool dataSaver) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return permanent_failure(ErrorKind::PartialChapter, "malformed at-home JSON");

    const std::string baseUrl = string_or_empty(j, "baseUrl");
    if (baseUrl.empty() || !j.contains("chapter") || !j["chapter"].is_object()) {
        return permanent_failure(ErrorKind::PartialChapter, "at-home JSON missing baseUrl or chapter");
    }
    const auto& ch = j["chapter"];
    const std::string hash = string_or_empty(ch, "hash");
    const char* listKey = dataSaver ? "dataSaver" : "data";
    const char* segment = dataSaver ? "data-saver" : "data";
    if (hash.empty() || !ch.contains(listKey) || !ch[listKey].is_array()) {
        return permanent_failure(ErrorKind::PartialChapter, std::string("at-home JSON missing hash or ") + listKey);
    }

    std::vector<PageAsset> pages;
    int ordinal = 0;
    for (const auto& f : ch[listKey]) {
        if (!f.is_string()) continue;
        pages.push_back(PageAsset{baseUrl + "/" + segment + "/" + hash + "/" + f.get<std::string>(), ++ordinal});
    }
    if (pages.empty()) return permanent_failure(ErrorKind::PartialChapter, "chapter has no pages");
    return make_ok(std::move(pages));
}
