#include "archiver.hpp"

#include "log.hpp"

#include <zip.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

static bool already_compressed(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".webp" || ext == ".gif" || ext == ".zip";
}

CallResult<ArchiveResult> ZipArchiver::create_archive(const std::string& sourceDir) {
    std::error_code ec;
    fs::path src = fs::path(sourceDir).lexically_normal();
    if (src.filename().empty()) src = src.parent_path();
    if (!fs::is_directory(src, ec)) return permanent_failure(ErrorKind::Filesystem, "not a directory: " + sourceDir);

    std::vector<fs::path> files;
    for (auto it = fs::recursive_directory_iterator(src, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) files.push_back(it->path());
    }
    if (ec) return permanent_failure(ErrorKind::Filesystem, "walk " + sourceDir + ": " + ec.message());
    std::sort(files.begin(), files.end());

    const fs::path out = fs::path(src.string() + ".zip");
    int zerr = 0;
    std::unique_ptr<zip_t, void (*)(zip_t*)> za(zip_open(out.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &zerr), zip_discard);
    if (!za) {
        zip_error_t error;
        zip_error_init_with_code(&error, zerr);
        std::string msg = zip_error_strerror(&error);
        zip_error_fini(&error);
        return permanent_failure(ErrorKind::Filesystem, "zip_open " + out.string() + ": " + msg);
    }

    for (const auto& f : files) {
        const std::string entry = f.lexically_relative(src).generic_string();
        zip_source_t* source = zip_source_file(za.get(), f.c_str(), 0, 0);
        if (!source) return permanent_failure(ErrorKind::Filesystem, "zip source " + f.string() + ": " + zip_strerror(za.get()));
        zip_int64_t idx = zip_file_add(za.get(), entry.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
        if (idx < 0) {
            zip_source_free(source);
            return permanent_failure(ErrorKind::Filesystem, "zip add " + entry + ": " + zip_strerror(za.get()));
        }
        if (already_compressed(f)) zip_set_file_compression(za.get(), static_cast<zip_uint64_t>(idx), ZIP_CM_STORE, 0);
    }

    if (zip_close(za.get()) != 0) {
        return permanent_failure(ErrorKind::Filesystem, "zip close " + out.string() + ": " + zip_strerror(za.get()));
    }
    za.release();  // zip_close freed the handle

    const auto size = fs::file_size(out, ec);
    if (ec) return permanent_failure(ErrorKind::Filesystem, "stat " + out.string() + ": " + ec.message());
    log_debug("ZIP", out.string() + " " + format_mb(size) + " (" + std::to_string(files.size()) + " entries)");
    return make_ok(ArchiveResult{out.string(), size});
}
