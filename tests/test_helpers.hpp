#pragma once

// ============================================================
// test_helpers.hpp -- Temporary data directories and byte helpers
// ============================================================

#include "common/platform.hpp"
#include "common/file_io.hpp"
#include "common/utils.hpp"
#include <string>
#include <vector>
#include <system_error>

// Fresh directory under the system temp path, removed on destruction
class TempDir {
public:
    TempDir() {
        path_ = (fs::temp_directory_path() / ("streamsaver-test-" + utils::generate_token())).string();
        file_io::ensure_dir(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string join(const std::string& rel) const {
        return (fs::path(path_) / rel).string();
    }

private:
    std::string path_;
};

inline std::vector<u8> bytes(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

inline std::string read_text(const std::string& path) {
    std::vector<u8> raw = file_io::read_file(path);
    return std::string(raw.begin(), raw.end());
}

inline void write_text(const std::string& path, const std::string& text) {
    file_io::ensure_parent_dirs(path);
    file_io::write_file_atomic(path, text.data(), text.size());
}

inline std::vector<std::string> dir_entries(const std::string& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        out.push_back(it->path().filename().string());
    }
    return out;
}
