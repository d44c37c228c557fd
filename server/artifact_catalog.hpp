#pragma once

// ============================================================
// artifact_catalog.hpp -- Finished artifacts in the output area
//   The directory itself is the index: list() enumerates it on
//   every call. Also hands out collision-free artifact names.
// ============================================================

#include "../common/platform.hpp"
#include "storage_layout.hpp"
#include <string>
#include <vector>
#include <mutex>

struct ArtifactInfo {
    std::string name;
    u64         size_bytes{0};
    u64         mtime_ns{0};
};

class ArtifactCatalog {
public:
    explicit ArtifactCatalog(const StorageLayout& layout);

    // Regular files only, newest first (ties by name ascending).
    // A missing output area yields an empty list.
    std::vector<ArtifactInfo> list() const;

    // "<disambiguator>-<sanitized name>"; the disambiguator is a
    // millisecond timestamp, strictly increasing within the process
    // and bumped past any file already present.
    std::string allocate_name(const std::string& original_name);

    std::string path_for(const std::string& artifact_name) const;

    const std::string& output_dir() const { return output_dir_; }

private:
    std::string output_dir_;

    std::mutex  name_mutex_;
    u64         last_stamp_{0};
};
