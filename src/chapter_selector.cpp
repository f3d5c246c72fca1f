#include "chapter_selector.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>

ChapterSelector::ChapterSelector(std::string preferredLanguage, std::size_t maxChapters)
    : preferredLanguage_(std::move(preferredLanguage)),
      maxChapters_(maxChapters) {}

std::optional<double> ChapterSelector::parse_chapter_number(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return std::nullopt;
    size_t b = s.find_last_not_of(" \t\r\n");
    const std::string trimmed = s.substr(a, b - a + 1);

    if (trimmed.find_first_not_of("0123456789.+-eE") != std::string::npos) return std::nullopt;

    const char* begin = trimmed.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

std::vector<ChapterRef> ChapterSelector::select(const std::vector<ChapterDescriptor>& rows) const {
    std::map<double, ChapterRef> byNumber;

    for (const auto& row : rows) {
        if (row.externalOnly) continue;
        auto number = parse_chapter_number(row.chapter);
        if (!number) continue;

        ChapterRef ref;
        ref.id = row.id;
        ref.numericIndex = *number;
        ref.chapterLabel = row.chapter;
        ref.languageCode = row.languageCode;
        ref.isPreferredLanguage = !preferredLanguage_.empty() && row.languageCode == preferredLanguage_;
        if (!row.title.empty()) ref.title = row.title;
        ref.externalOnly = false;

        auto it = byNumber.find(*number);
        if (it == byNumber.end()) {
            byNumber.emplace(*number, std::move(ref));
        } else if (!it->second.isPreferredLanguage && ref.isPreferredLanguage) {
            // first preferred row replaces a non-preferred one; later preferred rows never do
            it->second = std::move(ref);
        }
    }

    std::vector<ChapterRef> out;
    out.reserve(std::min(byNumber.size(), maxChapters_));
    for (auto& kv : byNumber) {
        if (out.size() >= maxChapters_) break;
        out.push_back(std::move(kv.second));
    }
    return out;
}
