#include "file_splitter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

std::uint64_t part_count(std::uint64_t sizeBytes, std::uint64_t chunkBytes) {
    if (chunkBytes == 0) return 0;
    if (sizeBytes == 0) return 1;
    return (sizeBytes + chunkBytes - 1) / chunkBytes;
}

static std::string part_suffix(std::uint64_t index) {
    std::string n = std::to_string(index);
    if (n.size() < 3) n.insert(0, 3 - n.size(), '0');
    return ".part" + n;
}

CallResult<std::vector<std::string>> split_file(const std::string& path,
                                                std::uint64_t chunkBytes,
                                                const std::string& outDir) {
    if (chunkBytes == 0) return permanent_failure(ErrorKind::Filesystem, "chunk size must be positive");

    std::error_code ec;
    const auto total = fs::file_size(path, ec);
    if (ec) return permanent_failure(ErrorKind::Filesystem, "stat " + path + ": " + ec.message());
    fs::create_directories(outDir, ec);
    if (ec) return permanent_failure(ErrorKind::Filesystem, "mkdir " + outDir + ": " + ec.message());

    std::ifstream in(path, std::ios::binary);
    if (!in) return permanent_failure(ErrorKind::Filesystem, "open " + path);

    const std::string stem = fs::path(path).filename().string();
    const std::uint64_t parts = part_count(total, chunkBytes);
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(parts));

    std::vector<char> buf(1 << 20);
    for (std::uint64_t i = 1; i <= parts; ++i) {
        fs::path partPath = fs::path(outDir) / (stem + part_suffix(i));
        std::ofstream ofs(partPath, std::ios::binary | std::ios::trunc);
        if (!ofs) return permanent_failure(ErrorKind::Filesystem, "create " + partPath.string());

        std::uint64_t remaining = std::min<std::uint64_t>(chunkBytes, total - (i - 1) * chunkBytes);
        while (remaining > 0) {
            const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buf.size()));
            in.read(buf.data(), want);
            if (in.gcount() != want) return permanent_failure(ErrorKind::Filesystem, "short read from " + path);
            ofs.write(buf.data(), want);
            if (!ofs) return permanent_failure(ErrorKind::Filesystem, "write failed " + partPath.string());
            remaining -= static_cast<std::uint64_t>(want);
        }
        out.push_back(partPath.string());
    }
    return make_ok(std::move(out));
}
