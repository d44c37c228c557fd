// ============================================================
// artifact_catalog.cpp -- ArtifactCatalog implementation
// ============================================================

#include "artifact_catalog.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <system_error>

ArtifactCatalog::ArtifactCatalog(const StorageLayout& layout)
    : output_dir_(layout.output_dir)
{}

std::vector<ArtifactInfo> ArtifactCatalog::list() const {
    std::vector<ArtifactInfo> out;
    std::error_code ec;
    for (fs::directory_iterator it(output_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code ec2;
        if (!it->is_regular_file(ec2)) continue;
        std::string p = it->path().string();
        ArtifactInfo info;
        info.name       = it->path().filename().string();
        info.size_bytes = file_io::get_file_size(p);
        info.mtime_ns   = file_io::get_mtime_ns(p);
        out.push_back(std::move(info));
    }
    if (ec) {
        LOG_DEBUG("Output area not readable: " + output_dir_ + ": " + ec.message());
    }

    std::sort(out.begin(), out.end(), [](const ArtifactInfo& a, const ArtifactInfo& b) {
        if (a.mtime_ns != b.mtime_ns) return a.mtime_ns > b.mtime_ns;
        return a.name < b.name;
    });
    return out;
}

std::string ArtifactCatalog::allocate_name(const std::string& original_name) {
    std::string safe = utils::sanitize_name(original_name);
    if (safe.empty()) safe = "video.bin";

    std::lock_guard<std::mutex> lk(name_mutex_);
    u64 stamp = std::max(utils::now_ms(), last_stamp_ + 1);
    std::string name;
    std::error_code ec;
    for (;;) {
        name = std::to_string(stamp) + "-" + safe;
        if (!fs::exists(fs::path(output_dir_) / name, ec)) break;
        ++stamp;
    }
    last_stamp_ = stamp;
    return name;
}

std::string ArtifactCatalog::path_for(const std::string& artifact_name) const {
    return (fs::path(output_dir_) / artifact_name).string();
}
