#include "icepack/downloader.hpp"
#include "icepack/dispatcher.hpp"
#include "icepack/errors.hpp"
#include "icepack/tree_hash.hpp"
#include <iostream>
#include <string>

namespace icepack {

Downloader::Downloader(VaultClient& client, DownloadInput input)
    : client_(client), input_(std::move(input)) {
    if (input_.part_size <= 0) {
        throw Error(errc::invalid_part_size,
                    "part size must be positive: " + std::to_string(input_.part_size));
    }
}

ArchiveFile& Downloader::file() {
    if (!file_) {
        throw std::logic_error("download file is not open");
    }
    return *file_;
}

void Downloader::check_job() {
    proto::JobDescription job =
        client_.describe_job(input_.account_id, input_.vault_name, input_.job_id);

    if (job.action() != "ArchiveRetrieval") {
        throw Error(errc::unsupported_action, job.action() + " action is not supported");
    }

    const std::string& status = job.status_code();
    if (status != "Succeeded") {
        if (status == "InProgress") {
            throw Error(errc::job_not_ready, "the job is not succeeded yet");
        }
        if (status == "Failed") {
            throw Error(errc::job_failed, "the job is failed: " + job.status_message());
        }
        throw Error(errc::unexpected_status, "job status is unexpected: " + status);
    }

    if (!job.has_tree_hash()) {
        throw Error(errc::unaligned_range, "the retrieved range must be tree-hash aligned");
    }

    size_ = job.archive_size();
    tree_hash_ = job.tree_hash();

    std::cout << "[Downloader] job " << input_.job_id << " succeeded, archive size " << size_
              << std::endl;
}

void Downloader::open_file() {
    ArchiveFile file = ArchiveFile::create_exclusive(input_.file_name);
    file.resize(size_);
    file_ = std::move(file);
    offset_ = 0;

    std::cout << "[Downloader] created " << input_.file_name << std::endl;
}

std::optional<ByteRange> Downloader::next_range() {
    if (offset_ >= size_) {
        return std::nullopt;
    }

    int64_t offset = offset_;
    offset_ += input_.part_size;

    int64_t limit = input_.part_size;
    if (offset + limit > size_) {
        limit = size_ - offset;
    }
    return ByteRange(offset, limit);
}

void Downloader::download_part(const ByteRange& range) {
    proto::JobOutput output = client_.get_job_output(input_.account_id, input_.vault_name,
                                                     input_.job_id, "bytes=" + range.to_string());

    // The whole part is held in memory
    const std::string& body = output.body();
    if (static_cast<int64_t>(body.size()) != range.length()) {
        throw Error(errc::size_mismatch, "size mismatch");
    }

    if (output.has_checksum()) {
        std::optional<std::string> tree_hash = compute_tree_hash(body);
        if (!tree_hash) {
            throw Error(errc::hashing_failed, "could not compute hash");
        }
        if (*tree_hash != output.checksum()) {
            throw Error(errc::hash_mismatch, "hash mismatch");
        }
    }

    size_t n = file().write_at(body, range.offset());
    if (static_cast<int64_t>(n) != range.length()) {
        throw Error(errc::short_write,
                    "could not write " + std::to_string(range.length()) + " bytes to the file");
    }
}

void Downloader::multipart_download(std::size_t jobs) {
    Dispatcher dispatcher(jobs, "downloading");
    dispatcher.run([this]() { return next_range(); },
                   [this](const ByteRange& range) { download_part(range); });
}

void Downloader::check_tree_hash() {
    std::optional<std::string> tree_hash = file().tree_hash();
    if (!tree_hash) {
        throw Error(errc::hashing_failed, "could not compute hash");
    }

    if (*tree_hash != tree_hash_) {
        throw Error(errc::hash_mismatch, "hash mismatch");
    }
}

void Downloader::download(std::size_t jobs) {
    check_job();
    open_file();

    try {
        multipart_download(jobs);
        check_tree_hash();
        std::cout << "[Downloader] " << input_.file_name << " matches tree hash " << tree_hash_
                  << std::endl;
        file_.reset();
    } catch (...) {
        file_.reset();
        throw;
    }
}

} // namespace icepack
