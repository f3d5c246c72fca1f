#pragma once

#include "destination.hpp"
#include "retry_policy.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct SenderOptions {
    std::uint64_t destinationLimitBytes = 50ull * 1024 * 1024;
    std::uint64_t chunkBytes = 45ull * 1024 * 1024;
    std::chrono::milliseconds partPause{1000};
    std::string partDir;  // where split parts are written; defaults to the artifact's directory
};

// Delivers one artifact: oversize files are split into numbered parts, every
// send goes through the retry policy, and exhaustion is reported in the
// outcome instead of being thrown.
class ResilientSender {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ResilientSender(Destination& destination,
                    const RetryPolicy& policy,
                    SenderOptions options,
                    Sleeper sleeper = {});

    DeliveryOutcome send(const Artifact& artifact, std::optional<long long> replyTo);

    // Plain message through the same retry policy; nullopt once attempts run out.
    std::optional<long long> send_text(const std::string& text, std::optional<long long> replyTo);
    std::optional<long long> send_photo(const std::string& path, const std::string& caption, std::optional<long long> replyTo);

    static std::string part_display_name(const std::string& name, std::uint64_t part, std::uint64_t total);
    static std::string caption_for(const std::string& displayName, std::uint64_t sizeBytes);

private:
    Destination& destination_;
    const RetryPolicy& policy_;
    SenderOptions opts_;
    Sleeper sleeper_;

    RetryOutcome<long long> send_with_retry(const std::string& path,
                                            const std::string& displayName,
                                            std::uint64_t sizeBytes,
                                            std::optional<long long> replyTo);
    DeliveryOutcome send_split(const Artifact& artifact, std::optional<long long> replyTo);
};
