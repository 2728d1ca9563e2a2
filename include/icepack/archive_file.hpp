#pragma once

#include "icepack/byte_range.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace icepack {

// Owns a file descriptor and does positioned reads and writes on it.
// Positioned I/O does not move a shared file offset, so several threads may
// read or write disjoint ranges of the same ArchiveFile concurrently.
class ArchiveFile {
public:
    // Opens an existing regular file for reading. Directories are rejected.
    static ArchiveFile open_for_reading(const std::string& path);

    // Creates a new file for reading and writing; fails if the path exists.
    static ArchiveFile create_exclusive(const std::string& path);

    ArchiveFile(const ArchiveFile&) = delete;
    ArchiveFile& operator=(const ArchiveFile&) = delete;

    ArchiveFile(ArchiveFile&& other) noexcept;
    ArchiveFile& operator=(ArchiveFile&& other) noexcept;

    ~ArchiveFile();

    const std::string& path() const { return path_; }

    // Current size from fstat
    int64_t size() const;

    // Truncates or extends the file to exactly `size` bytes
    void resize(int64_t size);

    // Reads exactly range.length() bytes; stops early only at end of file
    std::string read(const ByteRange& range) const;

    // Writes `data` at `offset` and returns the number of bytes written
    size_t write_at(const std::string& data, int64_t offset);

    // Tree hash of [offset, offset + length), streamed one leaf at a time.
    // A region past the end of the file hashes only the bytes that exist.
    std::optional<std::string> tree_hash(int64_t offset, int64_t length) const;

    // Tree hash of the whole file from its first byte
    std::optional<std::string> tree_hash() const;

private:
    ArchiveFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    size_t read_at(char* buf, size_t len, int64_t offset) const;

    int fd_ = -1;
    std::string path_;
};

} // namespace icepack
