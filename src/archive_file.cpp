#include "icepack/archive_file.hpp"
#include "icepack/errors.hpp"
#include "icepack/tree_hash.hpp"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace icepack {

ArchiveFile ArchiveFile::open_for_reading(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw io_error("open", path);
    }
    ArchiveFile file(fd, path);

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        throw io_error("stat", path);
    }
    if (S_ISDIR(st.st_mode)) {
        throw Error(errc::unsupported_file, "directories are not supported: " + path);
    }
    return file;
}

ArchiveFile ArchiveFile::create_exclusive(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw io_error("open", path);
    }
    return ArchiveFile(fd, path);
}

ArchiveFile::ArchiveFile(ArchiveFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

ArchiveFile& ArchiveFile::operator=(ArchiveFile&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

ArchiveFile::~ArchiveFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

int64_t ArchiveFile::size() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw io_error("stat", path_);
    }
    return static_cast<int64_t>(st.st_size);
}

void ArchiveFile::resize(int64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        throw io_error("truncate", path_);
    }
}

size_t ArchiveFile::read_at(char* buf, size_t len, int64_t offset) const {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd_, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw io_error("read", path_);
        }
        if (n == 0) {
            break; // EOF
        }
        done += static_cast<size_t>(n);
    }
    return done;
}

std::string ArchiveFile::read(const ByteRange& range) const {
    std::string data(static_cast<size_t>(range.length()), '\0');
    size_t n = read_at(&data[0], data.size(), range.offset());
    data.resize(n);
    return data;
}

size_t ArchiveFile::write_at(const std::string& data, int64_t offset) {
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done,
                             static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw io_error("write", path_);
        }
        if (n == 0) {
            break;
        }
        done += static_cast<size_t>(n);
    }
    return done;
}

std::optional<std::string> ArchiveFile::tree_hash(int64_t offset, int64_t length) const {
    TreeHasher hasher;
    std::vector<char> buffer(static_cast<size_t>(TREE_HASH_CHUNK_SIZE));

    int64_t remaining = length;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<int64_t>(remaining, TREE_HASH_CHUNK_SIZE));
        size_t got = read_at(buffer.data(), want, offset);
        if (got == 0) {
            break;
        }
        hasher.update(buffer.data(), got);
        offset += static_cast<int64_t>(got);
        remaining -= static_cast<int64_t>(got);
    }
    return hasher.finish();
}

std::optional<std::string> ArchiveFile::tree_hash() const {
    return tree_hash(0, size());
}

} // namespace icepack
