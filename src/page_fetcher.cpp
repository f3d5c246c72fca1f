#include "page_fetcher.hpp"

#include <cpr/cpr.h>

#include <fstream>

HttpPageFetcher::HttpPageFetcher(int timeoutMs, std::string userAgent)
    : timeoutMs_(timeoutMs), userAgent_(std::move(userAgent)) {}

CallResult<std::uint64_t> HttpPageFetcher::fetch(const std::string& url, const std::string& destPath) {
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Header{{"User-Agent", userAgent_}},
                               cpr::Timeout{timeoutMs_},
                               cpr::Redirect{true});
    if (r.error) {
        return transient_failure("transport: " + (r.error.message.empty() ? std::string("error") : r.error.message));
    }
    if (r.status_code != 200) {
        // the image host has no quota signalling; treat 429 like any other transient status
        if (r.status_code == 429 || r.status_code >= 500) return transient_failure("HTTP " + std::to_string(r.status_code));
        return permanent_failure(ErrorKind::PartialChapter, "HTTP " + std::to_string(r.status_code) + " for " + url);
    }
    if (r.text.empty()) return transient_failure("empty body for " + url);

    std::ofstream ofs(destPath, std::ios::binary | std::ios::trunc);
    if (!ofs) return permanent_failure(ErrorKind::Filesystem, "cannot open " + destPath);
    ofs.write(r.text.data(), static_cast<std::streamsize>(r.text.size()));
    ofs.close();
    if (!ofs) return permanent_failure(ErrorKind::Filesystem, "write failed " + destPath);
    return make_ok(static_cast<std::uint64_t>(r.text.size()));
}
