#pragma once

#include "icepack/archive_file.hpp"
#include "icepack/byte_range.hpp"
#include "icepack/vault_client.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace icepack {

// Options for a multipart upload to a vault
struct UploadInput {
    // Account that owns the vault, or "-" for the account of the credentials
    std::string account_id = DEFAULT_ACCOUNT_ID;

    std::string vault_name;

    // The file to upload
    std::string file_name;

    // Empty to initiate a new upload; set it to resume an interrupted one
    std::string upload_id;

    // Size of every part except the last, in bytes
    int64_t part_size = DEFAULT_PART_SIZE;
};

// Resumable parallel multipart upload.
//
// A resumed upload lists the parts the vault already holds and re-hashes the
// matching local bytes; parts whose hashes agree are skipped, everything else
// is sent again. Individual part failures are only logged: the vault rejects
// the completion request if the archive is not whole.
class Uploader {
public:
    Uploader(VaultClient& client, UploadInput input);

    // Runs every step below and returns the archive location.
    // At most `jobs` parts are in flight at once.
    std::string upload(std::size_t jobs);

    void open_file();
    void initiate_upload();
    void check_uploaded_parts();

    // Returns true if the stored part matches the local bytes
    bool check_part(const proto::PartRecord& part);

    void multipart_upload(std::size_t jobs);
    std::string complete_upload();

    // Next range not yet confirmed uploaded, or std::nullopt at end of file
    std::optional<ByteRange> next_range();

    void upload_part(const ByteRange& range);

    const UploadInput& input() const { return input_; }
    int64_t size() const { return size_; }
    const std::set<int64_t>& uploaded() const { return uploaded_; }

private:
    const ArchiveFile& file() const;

    VaultClient& client_;
    UploadInput input_;

    std::optional<ArchiveFile> file_;
    int64_t size_ = 0;
    int64_t offset_ = 0;
    std::set<int64_t> uploaded_;
};

} // namespace icepack
