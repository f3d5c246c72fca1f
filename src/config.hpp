#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct Config {
    // Series UUID or catalog URL containing one
    std::string mangaInput;
    std::string telegramBotToken;
    std::string telegramChatId;

    std::vector<std::string> languages{"en"};
    // Empty means the first entry of languages
    std::string preferredLanguage;
    int maxChapters = 10;
    bool useDataSaver = false;
    // Extra cover images posted as replies to the announcement
    bool uploadArtwork = false;
    int artworkLimit = 10;

    int bundleCapMb = 45;
    int destinationLimitMb = 50;
    int chunkMb = 45;

    // Catalog pacing
    int requestsPerWindow = 5;
    int windowMs = 1000;
    int jitterMs = 50;
    int maxSignaledWaitMs = 60000;

    int downloadConcurrency = 4;

    // Delivery retry and pacing
    int maxAttempts = 4;
    int backoffBaseMs = 1000;
    int backoffCapMs = 30000;
    int partPauseMs = 1000;
    int interBatchDelayMs = 1500;
    int deliveryParallelism = 1;

    int httpTimeoutMs = 30000;
    int downloadTimeoutMs = 120000;

    std::string scratchDir{"manga_download"};
    std::string logLevel{"info"};

    std::string series_id() const;
    // Both Telegram credentials are present, so failures can be reported in the chat.
    bool has_destination() const;
    std::string preferred_language() const;
    std::uint64_t bundle_cap_bytes() const;
    std::uint64_t destination_limit_bytes() const;
    std::uint64_t chunk_bytes() const;
};

using EnvLookup = std::function<const char*(const char*)>;

// KEY=value lines; '#' or ';' comments; optional surrounding quotes.
// Unknown keys are ignored. Throws FatalError(FatalConfiguration) on bad values.
void parse_env_string(const std::string& contents, Config& cfg);

// Overrides cfg with any recognised variable present in the environment.
void apply_environment(Config& cfg, const EnvLookup& lookup);

// Throws FatalError(FatalConfiguration) when required values are missing or out of range.
void validate_config(const Config& cfg);

// Defaults, then the optional .env file, then the real environment. No validation.
Config read_config(const std::string& envFilePath);

// read_config followed by validate_config.
Config load_config(const std::string& envFilePath);
