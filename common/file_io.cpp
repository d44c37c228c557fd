// ============================================================
// file_io.cpp -- File I/O implementation
// ============================================================

#include "file_io.hpp"
#include <vector>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <algorithm>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + errno_str(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path + ": " + errno_str(err));
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path + ": " + errno_str(err));
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// FileWriter
// ============================================================

FileWriter::~FileWriter() {
    abandon();
}

void FileWriter::open(const std::string& file_path, Mode mode) {
    if (is_open()) {
        throw std::runtime_error("FileWriter already open: " + path_);
    }
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= (mode == Mode::APPEND) ? O_APPEND : O_TRUNC;

    fd_ = ::open(file_path.c_str(), flags, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " + errno_str(errno));
    }
    path_    = file_path;
    written_ = 0;
}

void FileWriter::write(const void* data, size_t len) {
    if (!is_open()) {
        throw std::runtime_error("FileWriter::write on closed file");
    }
    const char* p = static_cast<const char*>(data);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("write failed: " + path_ + ": " + errno_str(errno));
        }
        p += n;
        remaining -= (size_t)n;
        written_  += (u64)n;
    }
}

void FileWriter::sync() {
    if (!is_open()) return;
    if (::fsync(fd_) != 0) {
        throw std::runtime_error("fsync failed: " + path_ + ": " + errno_str(errno));
    }
}

void FileWriter::close() {
    if (!is_open()) return;
    sync();
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
        throw std::runtime_error("close failed: " + path_ + ": " + errno_str(errno));
    }
}

void FileWriter::abandon() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================
// Utility functions
// ============================================================

void file_io::write_file_atomic(const std::string& path, const void* data, size_t len) {
    std::string tmp = path + ".tmp";
    {
        FileWriter w;
        w.open(tmp, FileWriter::Mode::TRUNCATE);
        try {
            w.write(data, len);
            w.close();
        } catch (...) {
            w.abandon();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw;
        }
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        std::error_code ec;
        fs::remove(tmp, ec);
        throw std::runtime_error("rename failed: " + tmp + " -> " + path + ": " + errno_str(err));
    }
}

std::vector<u8> file_io::read_file(const std::string& path) {
    MmapReader reader(path);
    std::vector<u8> buf((size_t)reader.size());
    if (reader.size() > 0) {
        std::memcpy(buf.data(), reader.data(), (size_t)reader.size());
    }
    return buf;
}

void file_io::ensure_dir(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory: " + path + ": " + ec.message());
    }
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        ensure_dir(parent.string());
    }
}

void file_io::sync_dir(const std::string& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw std::runtime_error("Cannot open directory: " + dir + ": " + errno_str(errno));
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw std::runtime_error("fsync failed: " + dir + ": " + errno_str(err));
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

u64 file_io::get_mtime_ns(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
#if defined(__linux__)
    return (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
#elif defined(__APPLE__)
    return (u64)st.st_mtimespec.tv_sec * 1000000000ULL + (u64)st.st_mtimespec.tv_nsec;
#else
    return (u64)st.st_mtime * 1000000000ULL;
#endif
}
