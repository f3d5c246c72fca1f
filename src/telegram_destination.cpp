#include "telegram_destination.hpp"

#include "log.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <chrono>

using nlohmann::json;

TelegramDestination::TelegramDestination(TelegramOptions options) : opts_(std::move(options)) {}

std::string TelegramDestination::endpoint(const std::string& method) const {
    return opts_.apiBase + "/bot" + opts_.botToken + "/" + method;
}

std::string TelegramDestination::truncate_caption(const std::string& caption) {
    if (caption.size() <= kMaxCaptionLength) return caption;
    std::string out = caption.substr(0, kMaxCaptionLength);
    // drop a trailing UTF-8 sequence cut short by the limit
    size_t i = out.size();
    size_t continuation = 0;
    while (i > 0 && continuation < 3 && (static_cast<unsigned char>(out[i - 1]) & 0xC0) == 0x80) {
        --i;
        ++continuation;
    }
    if (i > 0) {
        const auto lead = static_cast<unsigned char>(out[i - 1]);
        const size_t need = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
        if (continuation + 1 < need) out.resize(i - 1);
    }
    return out;
}

static std::string transport_error_of(const cpr::Response& r) {
    if (!r.error) return {};
    if (!r.error.message.empty()) return r.error.message;
    return "transport error " + std::to_string(static_cast<int>(r.error.code));
}

CallResult<long long> TelegramDestination::parse_response(long status,
                                                          const std::string& body,
                                                          const std::string& transportError) {
    if (!transportError.empty()) return transient_failure("transport: " + transportError);

    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return classify_http_failure<long long>(status, {}, std::chrono::milliseconds(0), body);
    }

    if (j.value("ok", false)) {
        const auto& result = j["result"];
        if (result.is_object() && result.contains("message_id") && result["message_id"].is_number_integer()) {
            return make_ok(result["message_id"].get<long long>());
        }
        // editMessageText may answer with `true`
        return make_ok<long long>(0);
    }

    long code = j.value("error_code", status);
    std::string description = j.value("description", std::string("no description"));
    std::chrono::milliseconds retryAfter{0};
    if (j.contains("parameters") && j["parameters"].is_object()) {
        retryAfter = std::chrono::seconds(j["parameters"].value("retry_after", 0));
    }
    return classify_http_failure<long long>(code, {}, retryAfter, description);
}

CallResult<long long> TelegramDestination::send_text(const std::string& text, std::optional<long long> replyTo) {
    json payload = {{"chat_id", opts_.chatId}, {"text", text}};
    if (replyTo) payload["reply_to_message_id"] = *replyTo;

    cpr::Response r = cpr::Post(cpr::Url{endpoint("sendMessage")},
                                cpr::Header{{"Content-Type", "application/json"}},
                                cpr::Body{payload.dump()},
                                cpr::Timeout{opts_.requestTimeoutMs});
    return parse_response(r.status_code, r.text, transport_error_of(r));
}

CallResult<long long> TelegramDestination::send_document(const std::string& filePath,
                                                         const std::string& fileName,
                                                         const std::string& caption,
                                                         std::optional<long long> replyTo) {
    cpr::Multipart form{{"chat_id", opts_.chatId}};
    form.parts.emplace_back("document", cpr::Files{cpr::File{filePath, fileName}});
    if (!caption.empty()) form.parts.emplace_back("caption", truncate_caption(caption));
    if (replyTo) form.parts.emplace_back("reply_to_message_id", std::to_string(*replyTo));

    log_debug("TG", "sendDocument " + fileName);
    cpr::Response r = cpr::Post(cpr::Url{endpoint("sendDocument")},
                                form,
                                cpr::Timeout{opts_.uploadTimeoutMs});
    return parse_response(r.status_code, r.text, transport_error_of(r));
}

CallResult<long long> TelegramDestination::send_photo(const std::string& filePath,
                                                      const std::string& caption,
                                                      std::optional<long long> replyTo) {
    cpr::Multipart form{{"chat_id", opts_.chatId}};
    form.parts.emplace_back("photo", cpr::Files{cpr::File{filePath}});
    if (!caption.empty()) form.parts.emplace_back("caption", truncate_caption(caption));
    if (replyTo) form.parts.emplace_back("reply_to_message_id", std::to_string(*replyTo));

    log_debug("TG", "sendPhoto " + filePath);
    cpr::Response r = cpr::Post(cpr::Url{endpoint("sendPhoto")},
                                form,
                                cpr::Timeout{opts_.uploadTimeoutMs});
    return parse_response(r.status_code, r.text, transport_error_of(r));
}

void TelegramDestination::edit_text(long long messageId, const std::string& text) {
    json payload = {{"chat_id", opts_.chatId}, {"message_id", messageId}, {"text", text}};
    cpr::Response r = cpr::Post(cpr::Url{endpoint("editMessageText")},
                                cpr::Header{{"Content-Type", "application/json"}},
                                cpr::Body{payload.dump()},
                                cpr::Timeout{opts_.requestTimeoutMs});
    auto res = parse_response(r.status_code, r.text, transport_error_of(r));
    if (!is_ok(res)) log_debug("TG", "editMessageText ignored: " + describe(res));
}
