#include "bundler.hpp"

#include "naming.hpp"

Bundler::Bundler(std::uint64_t capBytes) : capBytes_(capBytes) {}

void Bundler::add(ArchiveUnit unit) {
    const bool fits = current_.totalSizeBytes + unit.sizeBytes <= capBytes_;
    if (!current_.members.empty() && !fits) {
        closed_.push_back(std::move(current_));
        current_ = Bundle{};
    }
    current_.totalSizeBytes += unit.sizeBytes;
    current_.members.push_back(std::move(unit));
}

std::vector<Bundle> Bundler::finish() {
    if (!current_.members.empty()) {
        closed_.push_back(std::move(current_));
        current_ = Bundle{};
    }
    std::vector<Bundle> out = std::move(closed_);
    closed_.clear();
    return out;
}

std::vector<Bundle> Bundler::pack(std::vector<ArchiveUnit> units, std::uint64_t capBytes) {
    Bundler b(capBytes);
    for (auto& u : units) b.add(std::move(u));
    return b.finish();
}

std::string Bundler::bundle_name(const std::string& series, const Bundle& bundle) {
    std::string name = sanitize_filename(series);
    if (bundle.members.empty()) return name + ".zip";
    const auto& first = bundle.members.front().sourceChapter.chapterLabel;
    const auto& last = bundle.members.back().sourceChapter.chapterLabel;
    std::string range = "Ch." + pad_chapter(first);
    if (bundle.members.size() > 1) range += "-" + pad_chapter(last);
    range = sanitize_filename(range);

    // only the series part is shortened, the range keeps names unique
    const std::size_t room = kMaxFileNameLength > range.size() + 1 ? kMaxFileNameLength - range.size() - 1 : 0;
    if (name.size() > room) name = trim_copy(name.substr(0, room));
    return (name.empty() ? range : name + " " + range) + ".zip";
}
