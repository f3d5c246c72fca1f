#include "resilient_sender.hpp"

#include "file_splitter.hpp"
#include "log.hpp"

#include <filesystem>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <variant>

namespace fs = std::filesystem;

ResilientSender::ResilientSender(Destination& destination,
                                 const RetryPolicy& policy,
                                 SenderOptions options,
                                 Sleeper sleeper)
    : destination_(destination),
      policy_(policy),
      opts_(std::move(options)),
      sleeper_(std::move(sleeper)) {
    if (opts_.chunkBytes == 0) throw std::invalid_argument("chunkBytes must be positive");
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::string ResilientSender::part_display_name(const std::string& name, std::uint64_t part, std::uint64_t total) {
    return name + " (Part " + std::to_string(part) + "/" + std::to_string(total) + ")";
}

std::string ResilientSender::caption_for(const std::string& displayName, std::uint64_t sizeBytes) {
    return displayName + "\nSize: " + format_mb(sizeBytes);
}

static void fill_outcome(DeliveryOutcome& out, const RetryOutcome<long long>& r) {
    out.attempts += r.attempts;
    std::visit([&](const auto& alt) {
        using A = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<A, Ok<long long>>) {
            out.success = true;
            out.messageId = alt.value;
            out.failureKind = ErrorKind::None;
            out.failureDetail.clear();
        } else if constexpr (std::is_same_v<A, RateLimited>) {
            out.success = false;
            out.failureKind = ErrorKind::UpstreamRateLimited;
            out.failureDetail = "still rate limited after " + std::to_string(r.attempts) + " attempts";
        } else {
            out.success = false;
            out.failureKind = alt.kind == ErrorKind::TransientNetwork ? ErrorKind::PermanentDelivery : alt.kind;
            out.failureDetail = alt.detail;
        }
    }, r.result);
}

RetryOutcome<long long> ResilientSender::send_with_retry(const std::string& path,
                                                         const std::string& displayName,
                                                         std::uint64_t sizeBytes,
                                                         std::optional<long long> replyTo) {
    const std::string caption = caption_for(displayName, sizeBytes);
    return policy_.run<long long>("send " + displayName, [&](int) {
        return destination_.send_document(path, displayName, caption, replyTo);
    });
}

DeliveryOutcome ResilientSender::send(const Artifact& artifact, std::optional<long long> replyTo) {
    if (artifact.sizeBytes > opts_.destinationLimitBytes) {
        log_info("SEND", artifact.displayName + " is " + format_mb(artifact.sizeBytes) + ", splitting");
        return send_split(artifact, replyTo);
    }

    DeliveryOutcome out;
    out.artifact = artifact;
    fill_outcome(out, send_with_retry(artifact.path, artifact.displayName, artifact.sizeBytes, replyTo));
    if (out.success) {
        log_info("SEND", "uploaded " + artifact.displayName + " (" + format_mb(artifact.sizeBytes) + ")");
    } else {
        log_error("SEND", "giving up on " + artifact.displayName + ": " + out.failureDetail);
    }
    return out;
}

std::optional<long long> ResilientSender::send_text(const std::string& text, std::optional<long long> replyTo) {
    auto r = policy_.run<long long>("sendMessage", [&](int) {
        return destination_.send_text(text, replyTo);
    });
    if (auto* ok = std::get_if<Ok<long long>>(&r.result)) return ok->value;
    return std::nullopt;
}

std::optional<long long> ResilientSender::send_photo(const std::string& path,
                                                     const std::string& caption,
                                                     std::optional<long long> replyTo) {
    auto r = policy_.run<long long>("sendPhoto", [&](int) {
        return destination_.send_photo(path, caption, replyTo);
    });
    if (auto* ok = std::get_if<Ok<long long>>(&r.result)) return ok->value;
    return std::nullopt;
}

DeliveryOutcome ResilientSender::send_split(const Artifact& artifact, std::optional<long long> replyTo) {
    DeliveryOutcome out;
    out.artifact = artifact;

    const std::string partDir = opts_.partDir.empty()
        ? fs::path(artifact.path).parent_path().string()
        : opts_.partDir;
    auto split = split_file(artifact.path, opts_.chunkBytes, partDir.empty() ? "." : partDir);
    if (auto* failed = std::get_if<Failed>(&split)) {
        out.failureKind = failed->kind;
        out.failureDetail = failed->detail;
        log_error("SEND", "cannot split " + artifact.displayName + ": " + failed->detail);
        return out;
    }
    const auto parts = std::get<Ok<std::vector<std::string>>>(split).value;
    const std::uint64_t total = parts.size();

    for (std::uint64_t i = 0; i < total; ++i) {
        const std::string& partPath = parts[i];
        std::error_code ec;
        const std::uint64_t partSize = fs::file_size(partPath, ec);
        const std::string name = part_display_name(artifact.displayName, i + 1, total);

        fill_outcome(out, send_with_retry(partPath, name, ec ? 0 : partSize, replyTo));
        if (!out.success) {
            log_error("SEND", "part " + std::to_string(i + 1) + "/" + std::to_string(total) + " of " +
                      artifact.displayName + " failed, aborting artifact: " + out.failureDetail);
            for (std::uint64_t k = i; k < total; ++k) fs::remove(parts[k], ec);
            return out;
        }
        fs::remove(partPath, ec);
        log_info("SEND", "uploaded " + name);
        if (i + 1 < total) sleeper_(opts_.partPause);
    }
    return out;
}
