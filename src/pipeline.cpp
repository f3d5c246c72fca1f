#include "pipeline.hpp"

#include "bundler.hpp"
#include "chapter_selector.hpp"
#include "log.hpp"
#include "naming.hpp"
#include "scope_guard.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace fs = std::filesystem;

Pipeline::Pipeline(PipelineOptions options,
                   CatalogClient& catalog,
                   ChapterDownloader& downloader,
                   Archiver& archiver,
                   ResilientSender& sender,
                   Destination& destination,
                   Sleeper sleeper)
    : opts_(std::move(options)),
      catalog_(catalog),
      downloader_(downloader),
      archiver_(archiver),
      sender_(sender),
      destination_(destination),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    opts_.deliveryParallelism = std::max(1, opts_.deliveryParallelism);
}

// -------------------- orchestration --------------------
static std::string run_dir_name(const std::string& seriesId) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "run-" + sanitize_filename(seriesId) + "-" + std::to_string(ms);
}

RunReport Pipeline::run() {
    const fs::path scratch = fs::path(opts_.scratchDir);
    const fs::path root = scratch / run_dir_name(opts_.seriesId);
    auto cleanup = make_scope_guard([&scratch, &root] {
        std::error_code ec;
        fs::remove_all(root, ec);
        if (ec) log_warn("RUN", "could not remove " + root.string() + ": " + ec.message());
        if (fs::is_directory(scratch, ec) && fs::is_empty(scratch, ec)) fs::remove(scratch, ec);
    });

    try {
        return execute(root);
    } catch (const FatalError& ex) {
        log_error("RUN", std::string(error_kind_label(ex.kind())) + ": " + ex.what());
        notify_failure(ex.what());
        throw;
    } catch (const std::exception& ex) {
        log_error("RUN", std::string("unexpected error: ") + ex.what());
        notify_failure(ex.what());
        throw;
    }
}

RunReport Pipeline::execute(const fs::path& root) {
    RunReport report;

    log_info("RUN", "fetching series " + opts_.seriesId);
    const SeriesInfo info = catalog_.series_info(opts_.seriesId);
    report.seriesTitle = info.title;
    log_info("RUN", "series: " + report.seriesTitle);

    const auto rows = catalog_.list_chapters(opts_.seriesId, opts_.languages);
    ChapterSelector selector(opts_.preferredLanguage, opts_.maxChapters);
    report.selected = selector.select(rows);
    if (report.selected.empty()) {
        throw FatalError(ErrorKind::SelectionEmpty,
                         "no downloadable chapters for " + opts_.seriesId + " (" + std::to_string(rows.size()) + " feed rows)");
    }
    log_info("RUN", "selected " + std::to_string(report.selected.size()) + " of " + std::to_string(rows.size()) + " feed rows");

    const fs::path seriesDir = root / sanitize_filename(report.seriesTitle);
    fs::create_directories(seriesDir);

    announce(info, report.selected, seriesDir, report);
    if (!announcementId_) log_warn("RUN", "announcement not delivered, bundles will not be threaded");
    if (opts_.uploadArtwork && announcementId_) send_artwork(info, seriesDir, report);
    statusId_ = sender_.send_text("Downloading...", announcementId_);

    Bundler bundler(opts_.bundleCapBytes);
    const std::size_t total = report.selected.size();
    for (std::size_t i = 0; i < total; ++i) {
        const auto& ch = report.selected[i];
        log_info("RUN", "chapter " + std::to_string(i + 1) + "/" + std::to_string(total) + ": " + chapter_dir_name(ch));
        progress("Downloading chapter " + std::to_string(i + 1) + "/" + std::to_string(total));

        auto unit = fetch_chapter(ch, seriesDir);
        if (!unit) {
            report.skippedChapters.push_back(ch.chapterLabel);
            continue;
        }
        report.archived.push_back(*unit);
        bundler.add(std::move(*unit));
    }

    auto bundles = bundler.finish();
    report.bundleCount = bundles.size();
    log_info("RUN", std::to_string(report.archived.size()) + " chapters archived into " +
             std::to_string(bundles.size()) + " bundles, " + std::to_string(report.skippedChapters.size()) + " skipped");

    if (!bundles.empty()) {
        progress("Uploading " + std::to_string(bundles.size()) + " bundles");
        deliver(bundles, report.seriesTitle, root / "bundles", report);
        redrive(report);
    }

    progress("Done: " + std::to_string(report.delivered.size()) + "/" + std::to_string(bundles.size()) +
             " bundles delivered, " + std::to_string(report.skippedChapters.size()) + " chapters skipped");
    return report;
}

// -------------------- announcement --------------------
std::optional<std::string> Pipeline::fetch_image(const std::string& url, const fs::path& dir) {
    auto r = downloader_.download({PageAsset{url, 1}}, dir.string());
    if (!is_ok(r)) {
        log_warn("RUN", "image " + url + " not fetched: " + describe(r));
        return std::nullopt;
    }
    return (dir / page_file_name(1, url)).string();
}

void Pipeline::announce(const SeriesInfo& info, const std::vector<ChapterRef>& chapters,
                        const fs::path& seriesDir, RunReport& report) {
    const std::string text = announcement(info, chapters);
    if (!info.coverUrl.empty()) {
        if (auto cover = fetch_image(info.coverUrl, seriesDir / "cover")) {
            announcementId_ = sender_.send_photo(*cover, text, std::nullopt);
            if (announcementId_) {
                report.coverSent = true;
                return;
            }
            log_warn("RUN", "cover upload failed, announcing without it");
        }
    }
    announcementId_ = sender_.send_text(text, std::nullopt);
}

void Pipeline::send_artwork(const SeriesInfo& info, const fs::path& seriesDir, RunReport& report) {
    std::vector<std::string> urls;
    for (auto& url : catalog_.artwork(opts_.seriesId, opts_.artworkLimit)) {
        if (url != info.coverUrl) urls.push_back(std::move(url));
    }
    if (urls.empty()) {
        log_info("RUN", "no artwork to upload");
        return;
    }
    log_info("RUN", "uploading " + std::to_string(urls.size()) + " artwork images");

    const std::size_t total = urls.size();
    for (std::size_t i = 0; i < total; ++i) {
        if (i > 0) sleeper_(opts_.artworkPause);
        const fs::path dir = seriesDir / ("artwork_" + std::to_string(i + 1));
        auto image = fetch_image(urls[i], dir);
        if (!image) continue;
        const std::string caption = "Artwork " + std::to_string(i + 1) + "/" + std::to_string(total);
        if (sender_.send_photo(*image, caption, announcementId_)) {
            ++report.artworkSent;
        } else {
            log_warn("RUN", caption + " not delivered");
        }
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
}

// -------------------- chapters --------------------
std::optional<ArchiveUnit> Pipeline::fetch_chapter(const ChapterRef& chapter, const fs::path& seriesDir) {
    const fs::path dir = seriesDir / chapter_dir_name(chapter);
    // partial or packed, the page directory never outlives this call
    auto discard = make_scope_guard([&dir] {
        std::error_code ec;
        fs::remove_all(dir, ec);
    });

    try {
        auto pages = catalog_.resolve_pages(chapter.id, opts_.dataSaver);
        auto* pageList = std::get_if<Ok<std::vector<PageAsset>>>(&pages);
        if (!pageList) {
            log_warn("RUN", "skipping chapter " + chapter.chapterLabel + ": " + describe(pages));
            return std::nullopt;
        }

        auto downloaded = downloader_.download(pageList->value, dir.string());
        if (!is_ok(downloaded)) {
            log_warn("RUN", "skipping chapter " + chapter.chapterLabel + ": " + describe(downloaded));
            return std::nullopt;
        }

        auto archive = archiver_.create_archive(dir.string());
        auto* packed = std::get_if<Ok<ArchiveResult>>(&archive);
        if (!packed) {
            log_warn("RUN", "skipping chapter " + chapter.chapterLabel + ": " + describe(archive));
            return std::nullopt;
        }
        log_info("RUN", "packed " + fs::path(packed->value.path).filename().string() + " (" +
                 format_mb(packed->value.sizeBytes) + ")");
        return ArchiveUnit{packed->value.path, packed->value.sizeBytes, chapter};
    } catch (const std::exception& ex) {
        log_warn("RUN", "skipping chapter " + chapter.chapterLabel + ": " + ex.what());
        return std::nullopt;
    }
}

// -------------------- delivery --------------------
std::optional<Artifact> Pipeline::assemble_bundle(const Bundle& bundle,
                                                  const std::string& seriesTitle,
                                                  const fs::path& bundlesDir,
                                                  std::string& error) {
    const std::string name = Bundler::bundle_name(seriesTitle, bundle);
    const fs::path dir = bundlesDir / fs::path(name).stem();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        error = "mkdir " + dir.string() + ": " + ec.message();
        return std::nullopt;
    }
    auto discard = make_scope_guard([&dir] {
        std::error_code ignored;
        fs::remove_all(dir, ignored);
    });

    for (const auto& member : bundle.members) {
        const fs::path src(member.path);
        fs::rename(src, dir / src.filename(), ec);
        if (ec) {
            error = "move " + src.string() + ": " + ec.message();
            return std::nullopt;
        }
    }

    auto archive = archiver_.create_archive(dir.string());
    auto* packed = std::get_if<Ok<ArchiveResult>>(&archive);
    if (!packed) {
        error = describe(archive);
        return std::nullopt;
    }
    return Artifact{packed->value.path, name, packed->value.sizeBytes};
}

void Pipeline::deliver(const std::vector<Bundle>& bundles,
                       const std::string& seriesTitle,
                       const fs::path& bundlesDir,
                       RunReport& report) {
    const std::size_t batchSize = static_cast<std::size_t>(opts_.deliveryParallelism);

    for (std::size_t start = 0; start < bundles.size(); start += batchSize) {
        if (start > 0) sleeper_(opts_.interBatchDelay);
        const std::size_t end = std::min(bundles.size(), start + batchSize);

        std::vector<Artifact> batch;
        for (std::size_t i = start; i < end; ++i) {
            std::string error;
            auto artifact = assemble_bundle(bundles[i], seriesTitle, bundlesDir, error);
            if (!artifact) {
                DeliveryOutcome failed;
                failed.artifact.displayName = Bundler::bundle_name(seriesTitle, bundles[i]);
                failed.failureKind = ErrorKind::Filesystem;
                failed.failureDetail = error;
                log_error("RUN", "cannot assemble " + failed.artifact.displayName + ": " + error);
                record(std::move(failed), report);
                continue;
            }
            log_info("RUN", "bundle " + std::to_string(i + 1) + "/" + std::to_string(bundles.size()) + ": " +
                     artifact->displayName + " (" + format_mb(artifact->sizeBytes) + ")");
            batch.push_back(std::move(*artifact));
        }

        std::vector<DeliveryOutcome> outcomes(batch.size());
        if (batch.size() == 1) {
            outcomes[0] = sender_.send(batch[0], announcementId_);
        } else {
            std::vector<std::thread> senders;
            senders.reserve(batch.size());
            for (std::size_t k = 0; k < batch.size(); ++k) {
                senders.emplace_back([this, &batch, &outcomes, k] {
                    outcomes[k] = sender_.send(batch[k], announcementId_);
                });
            }
            for (auto& t : senders) t.join();
        }
        for (auto& o : outcomes) record(std::move(o), report);
    }
}

void Pipeline::record(DeliveryOutcome outcome, RunReport& report) {
    if (outcome.success) {
        std::error_code ec;
        fs::remove(outcome.artifact.path, ec);
        report.delivered.push_back(std::move(outcome));
    } else {
        report.failed.push_back(std::move(outcome));
    }
}

void Pipeline::redrive(RunReport& report) {
    if (report.failed.empty()) return;
    log_info("RUN", "re-driving " + std::to_string(report.failed.size()) + " failed artifacts");

    std::vector<DeliveryOutcome> pending = std::move(report.failed);
    report.failed.clear();
    for (auto& previous : pending) {
        std::error_code ec;
        if (previous.artifact.path.empty() || !fs::exists(previous.artifact.path, ec)) {
            report.failed.push_back(std::move(previous));
            continue;
        }
        sleeper_(opts_.interBatchDelay);
        ++report.redriven;
        auto again = sender_.send(previous.artifact, announcementId_);
        again.attempts += previous.attempts;
        record(std::move(again), report);
    }
}

// -------------------- notifications --------------------
static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& i : items) out += (out.empty() ? "" : ", ") + i;
    return out;
}

std::string Pipeline::announcement(const SeriesInfo& info, const std::vector<ChapterRef>& chapters) const {
    std::string range = "Ch." + pad_chapter(chapters.front().chapterLabel);
    if (chapters.size() > 1) range += "-" + pad_chapter(chapters.back().chapterLabel);

    std::string text = info.title + "\n\n";
    auto line = [&text](const std::string& label, const std::string& value) {
        if (!value.empty()) text += label + ": " + value + "\n";
    };
    line("Author", join(info.authors));
    line("Artist", join(info.artists));
    line("Year", info.year ? std::to_string(*info.year) : std::string());
    line("Status", info.status);
    line("Original language", info.originalLanguage);
    line("Rating", info.contentRating);
    text += "\n";
    line("Chapters", range + " (" + std::to_string(chapters.size()) + ")");
    line("Language", join(opts_.languages));
    line("Quality", opts_.dataSaver ? "Data Saver" : "Original");
    line("Genres", join(info.genres));
    line("Themes", join(info.themes));
    line("Tags", join(info.tags));
    text += "\nChapter bundles follow as replies.";
    if (!info.description.empty()) text += "\n\n" + info.description;
    return text;
}

void Pipeline::progress(const std::string& text) {
    if (statusId_) destination_.edit_text(*statusId_, text);
}

void Pipeline::notify_failure(const std::string& text) {
    notify_run_failure(destination_, text, announcementId_);
}

void notify_run_failure(Destination& destination, const std::string& text, std::optional<long long> replyTo) {
    try {
        auto r = destination.send_text("Run failed: " + text, replyTo);
        if (!is_ok(r)) log_warn("RUN", "failure notice not delivered: " + describe(r));
    } catch (const std::exception& ex) {
        log_warn("RUN", std::string("failure notice not delivered: ") + ex.what());
    }
}
