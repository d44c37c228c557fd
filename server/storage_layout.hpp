#pragma once

// ============================================================
// storage_layout.hpp -- Data directory layout
//   <root>/tmp/<session>/   staged chunks, snapshot, merge output
//   <root>/final/           finished artifacts (flat)
// ============================================================

#include "../common/file_io.hpp"
#include <string>

struct StorageLayout {
    std::string root;
    std::string staging_dir;
    std::string output_dir;

    explicit StorageLayout(const std::string& data_root)
        : root(data_root)
        , staging_dir((fs::path(data_root) / "tmp").string())
        , output_dir((fs::path(data_root) / "final").string())
    {}

    // Create both areas; throws std::runtime_error on failure
    void ensure() const {
        file_io::ensure_dir(staging_dir);
        file_io::ensure_dir(output_dir);
    }
};
