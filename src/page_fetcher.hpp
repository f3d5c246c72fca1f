#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>

// Downloads one page asset to a local file; returns the bytes written.
class PageFetcher {
public:
    virtual ~PageFetcher() = default;
    virtual CallResult<std::uint64_t> fetch(const std::string& url, const std::string& destPath) = 0;
};

class HttpPageFetcher : public PageFetcher {
public:
    HttpPageFetcher(int timeoutMs, std::string userAgent);

    CallResult<std::uint64_t> fetch(const std::string& url, const std::string& destPath) override;

private:
    int timeoutMs_;
    std::string userAgent_;
};
