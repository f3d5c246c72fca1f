#include "config.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "naming.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

static std::string to_upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

static int parse_int(const std::string& key, const std::string& val) {
    const std::string v = trim_copy(val);
    char* end = nullptr;
    errno = 0;
    long n = std::strtol(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0' || errno == ERANGE || n < INT32_MIN || n > INT32_MAX) {
        throw FatalError(ErrorKind::FatalConfiguration, key + " must be an integer, got '" + val + "'");
    }
    return static_cast<int>(n);
}

static bool parse_bool(const std::string& val) {
    std::string v = trim_copy(val);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

static std::vector<std::string> parse_list(const std::string& val) {
    std::vector<std::string> out;
    std::stringstream ss(val);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// Returns false for keys this program does not know.
static bool apply_key(Config& cfg, const std::string& rawKey, const std::string& val) {
    const std::string key = to_upper(trim_copy(rawKey));
    if (key == "MANGA_INPUT") cfg.mangaInput = trim_copy(val);
    else if (key == "TELEGRAM_BOT_TOKEN") cfg.telegramBotToken = trim_copy(val);
    else if (key == "TELEGRAM_CHAT_ID") cfg.telegramChatId = trim_copy(val);
    else if (key == "LANGUAGES") cfg.languages = parse_list(val);
    else if (key == "PREFERRED_LANGUAGE") cfg.preferredLanguage = trim_copy(val);
    else if (key == "MAX_CHAPTERS") cfg.maxChapters = parse_int(key, val);
    else if (key == "USE_DATA_SAVER") cfg.useDataSaver = parse_bool(val);
    else if (key == "UPLOAD_ARTWORK") cfg.uploadArtwork = parse_bool(val);
    else if (key == "ARTWORK_LIMIT") cfg.artworkLimit = parse_int(key, val);
    else if (key == "BUNDLE_CAP_MB") cfg.bundleCapMb = parse_int(key, val);
    else if (key == "DESTINATION_LIMIT_MB") cfg.destinationLimitMb = parse_int(key, val);
    else if (key == "CHUNK_MB") cfg.chunkMb = parse_int(key, val);
    else if (key == "REQUESTS_PER_WINDOW") cfg.requestsPerWindow = parse_int(key, val);
    else if (key == "WINDOW_MS") cfg.windowMs = parse_int(key, val);
    else if (key == "JITTER_MS") cfg.jitterMs = parse_int(key, val);
    else if (key == "MAX_SIGNALED_WAIT_MS") cfg.maxSignaledWaitMs = parse_int(key, val);
    else if (key == "DOWNLOAD_CONCURRENCY") cfg.downloadConcurrency = parse_int(key, val);
    else if (key == "MAX_ATTEMPTS") cfg.maxAttempts = parse_int(key, val);
    else if (key == "BACKOFF_BASE_MS") cfg.backoffBaseMs = parse_int(key, val);
    else if (key == "BACKOFF_CAP_MS") cfg.backoffCapMs = parse_int(key, val);
    else if (key == "PART_PAUSE_MS") cfg.partPauseMs = parse_int(key, val);
    else if (key == "INTER_BATCH_DELAY_MS") cfg.interBatchDelayMs = parse_int(key, val);
    else if (key == "DELIVERY_PARALLELISM") cfg.deliveryParallelism = parse_int(key, val);
    else if (key == "HTTP_TIMEOUT_MS") cfg.httpTimeoutMs = parse_int(key, val);
    else if (key == "DOWNLOAD_TIMEOUT_MS") cfg.downloadTimeoutMs = parse_int(key, val);
    else if (key == "SCRATCH_DIR") cfg.scratchDir = trim_copy(val);
    else if (key == "LOG_LEVEL") cfg.logLevel = trim_copy(val);
    else return false;
    return true;
}

static const char* kKnownKeys[] = {
    "MANGA_INPUT", "TELEGRAM_BOT_TOKEN", "TELEGRAM_CHAT_ID", "LANGUAGES", "PREFERRED_LANGUAGE",
    "MAX_CHAPTERS", "USE_DATA_SAVER", "UPLOAD_ARTWORK", "ARTWORK_LIMIT", "BUNDLE_CAP_MB", "DESTINATION_LIMIT_MB", "CHUNK_MB",
    "REQUESTS_PER_WINDOW", "WINDOW_MS", "JITTER_MS", "MAX_SIGNALED_WAIT_MS", "DOWNLOAD_CONCURRENCY",
    "MAX_ATTEMPTS", "BACKOFF_BASE_MS", "BACKOFF_CAP_MS", "PART_PAUSE_MS", "INTER_BATCH_DELAY_MS",
    "DELIVERY_PARALLELISM", "HTTP_TIMEOUT_MS", "DOWNLOAD_TIMEOUT_MS", "SCRATCH_DIR", "LOG_LEVEL",
};

void parse_env_string(const std::string& contents, Config& cfg) {
    std::istringstream iss(contents);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim_copy(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        if (line.rfind("export ", 0) == 0) line = trim_copy(line.substr(7));
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = line.substr(0, pos);
        std::string val = trim_copy(line.substr(pos + 1));
        if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        if (!apply_key(cfg, key, val)) log_debug("CFG", "ignoring unknown key " + trim_copy(key));
    }
}

void apply_environment(Config& cfg, const EnvLookup& lookup) {
    for (const char* key : kKnownKeys) {
        const char* v = lookup(key);
        if (v && !apply_key(cfg, key, v)) log_warn("CFG", std::string("unhandled key ") + key);
    }
}

// Rejects the current, parent and root directories; the run deletes what it creates there.
static bool is_safe_scratch_dir(const std::string& dir) {
    const std::string trimmed = trim_copy(dir);
    if (trimmed.empty()) return false;
    const fs::path p = fs::path(trimmed).lexically_normal();
    if (p == p.root_path()) return false;
    std::string s = p.generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s != "." && s != ".." && p.filename() != "..";
}

void validate_config(const Config& cfg) {
    auto fail = [](const std::string& msg) { throw FatalError(ErrorKind::FatalConfiguration, msg); };
    if (cfg.mangaInput.empty()) fail("MANGA_INPUT is not set");
    if (cfg.series_id().empty()) fail("MANGA_INPUT does not contain a series id");
    if (cfg.telegramBotToken.empty() || cfg.telegramChatId.empty()) fail("TELEGRAM_BOT_TOKEN or TELEGRAM_CHAT_ID is not set");
    if (cfg.languages.empty()) fail("LANGUAGES must name at least one language");
    if (cfg.maxChapters < 1) fail("MAX_CHAPTERS must be at least 1");
    if (cfg.bundleCapMb < 1 || cfg.destinationLimitMb < 1 || cfg.chunkMb < 1) fail("size limits must be at least 1 MB");
    if (cfg.chunkMb > cfg.destinationLimitMb) fail("CHUNK_MB must not exceed DESTINATION_LIMIT_MB");
    if (cfg.requestsPerWindow < 1 || cfg.windowMs < 0 || cfg.jitterMs < 0) fail("invalid rate limit settings");
    if (cfg.maxSignaledWaitMs < 0) fail("MAX_SIGNALED_WAIT_MS must not be negative");
    if (cfg.downloadConcurrency < 1) fail("DOWNLOAD_CONCURRENCY must be at least 1");
    if (cfg.maxAttempts < 1) fail("MAX_ATTEMPTS must be at least 1");
    if (cfg.backoffBaseMs < 0 || cfg.backoffCapMs < cfg.backoffBaseMs) fail("invalid back-off settings");
    if (cfg.partPauseMs < 0 || cfg.interBatchDelayMs < 0) fail("pauses must not be negative");
    if (cfg.deliveryParallelism < 1) fail("DELIVERY_PARALLELISM must be at least 1");
    if (cfg.httpTimeoutMs < 1 || cfg.downloadTimeoutMs < 1) fail("timeouts must be positive");
    if (cfg.artworkLimit < 0) fail("ARTWORK_LIMIT must not be negative");
    if (!is_safe_scratch_dir(cfg.scratchDir)) fail("SCRATCH_DIR must name a dedicated directory, got '" + cfg.scratchDir + "'");
}

Config read_config(const std::string& envFilePath) {
    Config cfg;
    if (!envFilePath.empty()) {
        std::ifstream f(envFilePath);
        if (!f) throw FatalError(ErrorKind::FatalConfiguration, "cannot read config file " + envFilePath);
        std::string contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        parse_env_string(contents, cfg);
    }
    apply_environment(cfg, [](const char* k) { return std::getenv(k); });
    return cfg;
}

Config load_config(const std::string& envFilePath) {
    Config cfg = read_config(envFilePath);
    validate_config(cfg);
    return cfg;
}

std::string Config::series_id() const { return extract_uuid(mangaInput); }

bool Config::has_destination() const { return !telegramBotToken.empty() && !telegramChatId.empty(); }

std::string Config::preferred_language() const {
    if (!preferredLanguage.empty()) return preferredLanguage;
    return languages.empty() ? std::string() : languages.front();
}

std::uint64_t Config::bundle_cap_bytes() const { return static_cast<std::uint64_t>(bundleCapMb) * 1024 * 1024; }
std::uint64_t Config::destination_limit_bytes() const { return static_cast<std::uint64_t>(destinationLimitMb) * 1024 * 1024; }
std::uint64_t Config::chunk_bytes() const { return static_cast<std::uint64_t>(chunkMb) * 1024 * 1024; }
