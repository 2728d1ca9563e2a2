#include "icepack/uploader.hpp"
#include "icepack/dispatcher.hpp"
#include "icepack/errors.hpp"
#include "icepack/tree_hash.hpp"
#include <iostream>
#include <string>

namespace icepack {

Uploader::Uploader(VaultClient& client, UploadInput input)
    : client_(client), input_(std::move(input)) {
    if (input_.part_size <= 0) {
        throw Error(errc::invalid_part_size,
                    "part size must be positive: " + std::to_string(input_.part_size));
    }
}

const ArchiveFile& Uploader::file() const {
    if (!file_) {
        throw std::logic_error("upload file is not open");
    }
    return *file_;
}

void Uploader::open_file() {
    ArchiveFile file = ArchiveFile::open_for_reading(input_.file_name);
    size_ = file.size();
    file_ = std::move(file);
    offset_ = 0;
    uploaded_.clear();
}

void Uploader::initiate_upload() {
    if (!input_.upload_id.empty()) {
        return;
    }

    input_.upload_id =
        client_.initiate_multipart_upload(input_.account_id, input_.vault_name, input_.part_size);
}

std::optional<ByteRange> Uploader::next_range() {
    int64_t offset = 0;

    for (;;) {
        if (offset_ >= size_) {
            return std::nullopt;
        }

        offset = offset_;
        offset_ += input_.part_size;

        if (uploaded_.count(offset) == 0) {
            break;
        }
    }

    int64_t limit = input_.part_size;
    if (offset + limit > size_) {
        limit = size_ - offset;
    }
    return ByteRange(offset, limit);
}

void Uploader::upload_part(const ByteRange& range) {
    std::string body = file().read(range);
    if (static_cast<int64_t>(body.size()) != range.length()) {
        throw Error(errc::size_mismatch, "could not read part (" + range.to_string() + ")");
    }

    std::optional<std::string> tree_hash = compute_tree_hash(body);
    if (!tree_hash) {
        throw Error(errc::hashing_failed, "could not compute hashes");
    }

    std::string content_range = "bytes " + range.to_string() + "/*";
    client_.upload_multipart_part(input_.account_id, input_.vault_name, input_.upload_id,
                                  content_range, *tree_hash, body);
}

void Uploader::multipart_upload(std::size_t jobs) {
    Dispatcher dispatcher(jobs, "uploading");
    dispatcher.run([this]() { return next_range(); },
                   [this](const ByteRange& range) { upload_part(range); });
}

bool Uploader::check_part(const proto::PartRecord& part) {
    std::optional<ByteRange> range = ByteRange::parse(part.range_in_bytes());
    if (!range) {
        throw Error(errc::invalid_range, "part (" + part.range_in_bytes() + ") range is invalid");
    }

    if (range->offset() >= size_) {
        throw Error(errc::file_size_mismatch, "file size mismatch: part (" +
                                                  part.range_in_bytes() + "), file size " +
                                                  std::to_string(size_));
    }

    std::optional<std::string> tree_hash = file().tree_hash(range->offset(), range->length());
    if (!tree_hash) {
        throw Error(errc::hashing_failed,
                    "could not compute hashes of part (" + part.range_in_bytes() + ")");
    }

    if (*tree_hash == part.tree_hash()) {
        uploaded_.insert(range->offset());
        return true;
    }
    return false;
}

void Uploader::check_uploaded_parts() {
    std::cout << "[Uploader] start checking uploaded parts" << std::endl;

    PartPager pager(client_, input_.account_id, input_.vault_name, input_.upload_id);
    while (pager.next()) {
        const proto::PartListPage& page = pager.page();
        if (page.part_size() != input_.part_size) {
            throw Error(errc::part_size_mismatch,
                        "part size mismatch: remote " + std::to_string(page.part_size()) +
                            ", local " + std::to_string(input_.part_size));
        }

        for (const auto& part : page.parts()) {
            if (check_part(part)) {
                std::cout << "[Uploader] part (" << part.range_in_bytes() << ") is ok" << std::endl;
            } else {
                std::cout << "[Uploader] part (" << part.range_in_bytes() << ") hash mismatch"
                          << std::endl;
            }
        }
    }

    std::cout << "[Uploader] finish checking uploaded parts" << std::endl;
}

std::string Uploader::complete_upload() {
    std::optional<std::string> tree_hash = file().tree_hash();
    if (!tree_hash) {
        throw Error(errc::hashing_failed, "could not compute hashes");
    }

    return client_.complete_multipart_upload(input_.account_id, input_.vault_name,
                                             input_.upload_id, size_, *tree_hash);
}

std::string Uploader::upload(std::size_t jobs) {
    open_file();

    try {
        initiate_upload();
        std::cout << "[Uploader] upload " << input_.upload_id << " initiated" << std::endl;

        check_uploaded_parts();
        multipart_upload(jobs);

        std::string location = complete_upload();
        std::cout << "[Uploader] upload location is " << location << std::endl;

        file_.reset();
        return location;
    } catch (...) {
        file_.reset();
        throw;
    }
}

} // namespace icepack
