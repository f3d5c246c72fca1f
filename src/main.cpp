#include "archiver.hpp"
#include "catalog.hpp"
#include "chapter_downloader.hpp"
#include "concurrency_gate.hpp"
#include "config.hpp"
#include "log.hpp"
#include "mangadex_catalog.hpp"
#include "page_fetcher.hpp"
#include "pipeline.hpp"
#include "rate_limiter.hpp"
#include "resilient_sender.hpp"
#include "retry_policy.hpp"
#include "telegram_destination.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

static const std::string kUserAgent = "mangarelay/1.0";

int main(int argc, char** argv) {
    std::string envFile;
    if (const char* p = std::getenv("CONFIG_FILE")) envFile = p;
    if (argc > 1) envFile = argv[1];

    Config cfg;
    try {
        cfg = read_config(envFile);
        validate_config(cfg);
    } catch (const FatalError& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        if (cfg.has_destination()) {
            TelegramOptions tg;
            tg.botToken = cfg.telegramBotToken;
            tg.chatId = cfg.telegramChatId;
            tg.requestTimeoutMs = cfg.httpTimeoutMs > 0 ? cfg.httpTimeoutMs : 30000;
            TelegramDestination telegram(tg);
            notify_run_failure(telegram, std::string("configuration error: ") + ex.what());
        }
        return 2;
    }
    set_log_level_from_string(cfg.logLevel);

    try {
        RateLimiter limiter(RateLimiterOptions{cfg.requestsPerWindow, cfg.windowMs, cfg.jitterMs, cfg.maxSignaledWaitMs});
        ConcurrencyGate gate(static_cast<std::size_t>(cfg.downloadConcurrency));

        RetryPolicy catalogRetry(cfg.maxAttempts,
                                 RetryPolicy::exponential(std::chrono::milliseconds(cfg.backoffBaseMs),
                                                          std::chrono::milliseconds(cfg.backoffCapMs)),
                                 {},
                                 std::chrono::milliseconds(cfg.maxSignaledWaitMs));
        RetryPolicy pageRetry(3, RetryPolicy::linear(std::chrono::milliseconds(500)));
        RetryPolicy deliveryRetry = catalogRetry;

        MangaDexCatalog mangadex(MangaDexOptions{"https://api.mangadex.org", cfg.httpTimeoutMs, kUserAgent});
        CatalogClient catalog(mangadex, limiter, catalogRetry);
        HttpPageFetcher fetcher(cfg.downloadTimeoutMs, kUserAgent);
        ChapterDownloader downloader(fetcher, gate, pageRetry);
        ZipArchiver archiver;

        TelegramOptions tg;
        tg.botToken = cfg.telegramBotToken;
        tg.chatId = cfg.telegramChatId;
        tg.requestTimeoutMs = cfg.httpTimeoutMs;
        tg.uploadTimeoutMs = std::max(cfg.downloadTimeoutMs, 300000);
        TelegramDestination telegram(tg);

        SenderOptions so;
        so.destinationLimitBytes = cfg.destination_limit_bytes();
        so.chunkBytes = cfg.chunk_bytes();
        so.partPause = std::chrono::milliseconds(cfg.partPauseMs);
        ResilientSender sender(telegram, deliveryRetry, so);

        PipelineOptions po;
        po.seriesId = cfg.series_id();
        po.languages = cfg.languages;
        po.preferredLanguage = cfg.preferred_language();
        po.maxChapters = static_cast<std::size_t>(cfg.maxChapters);
        po.dataSaver = cfg.useDataSaver;
        po.bundleCapBytes = cfg.bundle_cap_bytes();
        po.scratchDir = cfg.scratchDir;
        po.deliveryParallelism = cfg.deliveryParallelism;
        po.interBatchDelay = std::chrono::milliseconds(cfg.interBatchDelayMs);
        po.uploadArtwork = cfg.uploadArtwork;
        po.artworkLimit = cfg.artworkLimit;
        po.artworkPause = std::chrono::milliseconds(cfg.partPauseMs);

        Pipeline pipeline(po, catalog, downloader, archiver, sender, telegram);
        RunReport report = pipeline.run();

        std::cout << "Series: " << report.seriesTitle << "\n"
                  << "  chapters selected: " << report.selected.size()
                  << ", archived: " << report.archived.size()
                  << ", skipped: " << report.skippedChapters.size() << "\n"
                  << "  bundles: " << report.bundleCount
                  << ", delivered: " << report.delivered.size()
                  << ", failed: " << report.failed.size()
                  << " (re-driven: " << report.redriven << ")" << std::endl;
        for (const auto& f : report.failed) {
            std::cerr << "  not delivered: " << f.artifact.displayName << " ["
                      << error_kind_label(f.failureKind) << "] " << f.failureDetail << std::endl;
        }
        return report.failed.empty() ? 0 : 3;
    } catch (const FatalError& ex) {
        std::cerr << "Error (" << error_kind_label(ex.kind()) << "): " << ex.what() << std::endl;
        return ex.kind() == ErrorKind::FatalConfiguration ? 2 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
