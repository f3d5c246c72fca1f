#pragma once

#include "archiver.hpp"
#include "catalog.hpp"
#include "chapter_downloader.hpp"
#include "destination.hpp"
#include "resilient_sender.hpp"
#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct PipelineOptions {
    std::string seriesId;
    std::vector<std::string> languages{"en"};
    std::string preferredLanguage{"en"};
    std::size_t maxChapters = 10;
    bool dataSaver = false;
    std::uint64_t bundleCapBytes = 45ull * 1024 * 1024;
    std::string scratchDir{"manga_download"};
    int deliveryParallelism = 1;
    std::chrono::milliseconds interBatchDelay{1500};
    bool uploadArtwork = false;
    int artworkLimit = 10;
    std::chrono::milliseconds artworkPause{1000};
};

struct RunReport {
    std::string seriesTitle;
    bool coverSent = false;
    std::size_t artworkSent = 0;
    std::vector<ChapterRef> selected;
    std::vector<ArchiveUnit> archived;
    std::vector<std::string> skippedChapters;
    std::size_t bundleCount = 0;
    std::vector<DeliveryOutcome> delivered;
    std::vector<DeliveryOutcome> failed;
    std::size_t redriven = 0;
};

// Sends "Run failed: <text>" once; delivery problems are logged, never thrown.
void notify_run_failure(Destination& destination, const std::string& text, std::optional<long long> replyTo = std::nullopt);

// Runs one acquisition-and-delivery pass: select chapters, download and pack
// each, bundle, deliver, re-drive failures once, clean the scratch tree.
// Work happens in a per-run directory under scratchDir; only that directory
// is removed, plus scratchDir itself when nothing else is left in it.
// Throws FatalError for run-aborting conditions after one failure notice.
class Pipeline {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    Pipeline(PipelineOptions options,
             CatalogClient& catalog,
             ChapterDownloader& downloader,
             Archiver& archiver,
             ResilientSender& sender,
             Destination& destination,
             Sleeper sleeper = {});

    RunReport run();

private:
    PipelineOptions opts_;
    CatalogClient& catalog_;
    ChapterDownloader& downloader_;
    Archiver& archiver_;
    ResilientSender& sender_;
    Destination& destination_;
    Sleeper sleeper_;

    std::optional<long long> announcementId_;
    std::optional<long long> statusId_;

    RunReport execute(const std::filesystem::path& root);
    std::optional<std::string> fetch_image(const std::string& url, const std::filesystem::path& dir);
    void announce(const SeriesInfo& info, const std::vector<ChapterRef>& chapters,
                  const std::filesystem::path& seriesDir, RunReport& report);
    void send_artwork(const SeriesInfo& info, const std::filesystem::path& seriesDir, RunReport& report);
    std::optional<ArchiveUnit> fetch_chapter(const ChapterRef& chapter, const std::filesystem::path& seriesDir);
    std::optional<Artifact> assemble_bundle(const Bundle& bundle,
                                            const std::string& seriesTitle,
                                            const std::filesystem::path& bundlesDir,
                                            std::string& error);
    void deliver(const std::vector<Bundle>& bundles,
                 const std::string& seriesTitle,
                 const std::filesystem::path& bundlesDir,
                 RunReport& report);
    void record(DeliveryOutcome outcome, RunReport& report);
    void redrive(RunReport& report);
    void progress(const std::string& text);
    void notify_failure(const std::string& text);

    std::string announcement(const SeriesInfo& info, const std::vector<ChapterRef>& chapters) const;
};
