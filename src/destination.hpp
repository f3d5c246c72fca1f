#pragma once

#include "errors.hpp"

#include <optional>
#include <string>

// Message-oriented delivery target.
class Destination {
public:
    virtual ~Destination() = default;

    virtual CallResult<long long> send_text(const std::string& text, std::optional<long long> replyTo) = 0;
    virtual CallResult<long long> send_document(const std::string& filePath,
                                                const std::string& fileName,
                                                const std::string& caption,
                                                std::optional<long long> replyTo) = 0;
    virtual CallResult<long long> send_photo(const std::string& filePath,
                                             const std::string& caption,
                                             std::optional<long long> replyTo) = 0;
    // Best-effort progress update; failures are logged and dropped.
    virtual void edit_text(long long messageId, const std::string& text) = 0;
};
