#pragma once

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Dedups catalog rows by chapter number and bounds the result.
class ChapterSelector {
public:
    ChapterSelector(std::string preferredLanguage, std::size_t maxChapters);

    // Ascending, one entry per chapter number, at most maxChapters entries.
    // Rows that are external-only or carry no parsable number are dropped.
    std::vector<ChapterRef> select(const std::vector<ChapterDescriptor>& rows) const;

    static std::optional<double> parse_chapter_number(const std::string& s);

private:
    std::string preferredLanguage_;
    std::size_t maxChapters_;
};
