#pragma once

#include "icepack/archive_file.hpp"
#include "icepack/byte_range.hpp"
#include "icepack/vault_client.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace icepack {

// Options for downloading the output of a retrieval job
struct DownloadInput {
    // Account that owns the vault, or "-" for the account of the credentials
    std::string account_id = DEFAULT_ACCOUNT_ID;

    std::string vault_name;

    // Where the archive is saved. The file must not exist yet.
    std::string file_name;

    // The retrieval job whose output is downloaded
    std::string job_id;

    // Size of every part except the last, in bytes
    int64_t part_size = DEFAULT_PART_SIZE;
};

// Parallel ranged download of a succeeded archive retrieval job.
// Not resumable: every run creates a new output file.
class Downloader {
public:
    Downloader(VaultClient& client, DownloadInput input);

    // Runs every step below. At most `jobs` parts are in flight at once.
    void download(std::size_t jobs);

    void check_job();
    void open_file();
    void multipart_download(std::size_t jobs);
    void check_tree_hash();

    std::optional<ByteRange> next_range();
    void download_part(const ByteRange& range);

    const DownloadInput& input() const { return input_; }
    int64_t size() const { return size_; }
    const std::string& tree_hash() const { return tree_hash_; }

private:
    ArchiveFile& file();

    VaultClient& client_;
    DownloadInput input_;

    std::optional<ArchiveFile> file_;
    std::string tree_hash_;
    int64_t size_ = 0;
    int64_t offset_ = 0;
};

} // namespace icepack
