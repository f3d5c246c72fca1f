#pragma once

#include "errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Series metadata shown in the announcement.
struct SeriesInfo {
    std::string id;
    std::string title;
    std::string description;
    std::vector<std::string> authors;
    std::vector<std::string> artists;
    std::optional<int> year;
    std::string status;
    std::string originalLanguage;
    std::string contentRating;
    std::vector<std::string> genres;
    std::vector<std::string> themes;
    std::vector<std::string> tags;
    std::string coverUrl;  // empty when the series has no cover
};

// Raw chapter row as returned by the catalog feed.
struct ChapterDescriptor {
    std::string id;
    std::string chapter;        // numeric string, may be empty
    std::string languageCode;
    std::string title;
    bool externalOnly = false;  // hosted off-catalog, no pages to fetch
};

struct ChapterRef {
    std::string id;
    double numericIndex = 0.0;
    std::string chapterLabel;
    std::string languageCode;
    bool isPreferredLanguage = false;
    std::optional<std::string> title;
    bool externalOnly = false;
};

struct PageAsset {
    std::string url;
    int ordinal = 1;
};

struct ArchiveUnit {
    std::string path;
    std::uint64_t sizeBytes = 0;
    ChapterRef sourceChapter;
};

struct Bundle {
    std::vector<ArchiveUnit> members;
    std::uint64_t totalSizeBytes = 0;
};

// Anything handed to the sender: a chapter archive or a bundle archive.
struct Artifact {
    std::string path;
    std::string displayName;
    std::uint64_t sizeBytes = 0;
};

struct DeliveryOutcome {
    Artifact artifact;
    int attempts = 0;
    bool success = false;
    long long messageId = 0;            // valid when success
    ErrorKind failureKind = ErrorKind::None;
    std::string failureDetail;
};
