#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>

struct ArchiveResult {
    std::string path;
    std::uint64_t sizeBytes = 0;
};

// Packs a directory into one archive file.
class Archiver {
public:
    virtual ~Archiver() = default;
    virtual CallResult<ArchiveResult> create_archive(const std::string& sourceDir) = 0;
};

// Writes "<sourceDir>.zip" next to the directory. Entries are added in name
// order relative to sourceDir, so the same tree always yields the same layout.
class ZipArchiver : public Archiver {
public:
    CallResult<ArchiveResult> create_archive(const std::string& sourceDir) override;
};
