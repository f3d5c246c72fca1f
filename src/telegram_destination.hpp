#pragma once

#include "destination.hpp"

#include <cstddef>
#include <string>

struct TelegramOptions {
    std::string botToken;
    std::string chatId;
    int requestTimeoutMs = 30000;
    int uploadTimeoutMs = 300000;
    std::string apiBase = "https://api.telegram.org";
};

// Telegram Bot API adapter (sendMessage, sendDocument, sendPhoto, editMessageText).
class TelegramDestination : public Destination {
public:
    static constexpr std::size_t kMaxCaptionLength = 1024;

    explicit TelegramDestination(TelegramOptions options);

    CallResult<long long> send_text(const std::string& text, std::optional<long long> replyTo) override;
    CallResult<long long> send_document(const std::string& filePath,
                                        const std::string& fileName,
                                        const std::string& caption,
                                        std::optional<long long> replyTo) override;
    CallResult<long long> send_photo(const std::string& filePath,
                                     const std::string& caption,
                                     std::optional<long long> replyTo) override;
    void edit_text(long long messageId, const std::string& text) override;

    // Maps a Bot API reply onto a CallResult carrying result.message_id.
    static CallResult<long long> parse_response(long status,
                                                const std::string& body,
                                                const std::string& transportError);

    static std::string truncate_caption(const std::string& caption);

private:
    TelegramOptions opts_;
    std::string endpoint(const std::string& method) const;
};
