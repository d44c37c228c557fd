#pragma once

// ============================================================
// file_io.hpp -- File I/O primitives (mmap read, durable write)
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// ---- FileWriter: sequential writer with explicit durability ----
class FileWriter {
public:
    enum class Mode {
        TRUNCATE,  // create or empty the file
        APPEND,    // create or keep existing bytes, every write goes to the end
    };

    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Throws std::runtime_error if the file cannot be opened
    void open(const std::string& path, Mode mode);

    // Write all of data; throws on error (partial writes are retried)
    void write(const void* data, size_t len);

    // fsync the file descriptor
    void sync();

    // sync() then close; throws if either fails. No-op if not open.
    void close();

    // Close without sync, ignoring errors (cleanup paths)
    void abandon();

    bool is_open() const { return fd_ >= 0; }
    u64 bytes_written() const { return written_; }
    const std::string& path() const { return path_; }

private:
    int         fd_{-1};
    u64         written_{0};
    std::string path_;
};

// ---- Utility functions ----

// Write data to path via a temporary sibling, fsync, then rename into place
void write_file_atomic(const std::string& path, const void* data, size_t len);

// Read entire file into memory; throws std::runtime_error if unreadable
std::vector<u8> read_file(const std::string& path);

// Create directory (and parents); throws on failure
void ensure_dir(const std::string& path);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// fsync a directory so renames inside it are durable
void sync_dir(const std::string& dir);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Get file modification time as nanoseconds since epoch; 0 if not found
u64 get_mtime_ns(const std::string& path);

} // namespace file_io
