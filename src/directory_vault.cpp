#include "icepack/directory_vault.hpp"
#include "icepack/archive_file.hpp"
#include "icepack/byte_range.hpp"
#include "icepack/errors.hpp"
#include "icepack/hex_utils.hpp"
#include "icepack/tree_hash.hpp"
#include <google/protobuf/message.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace icepack {

namespace {

const char* const MANIFEST_FILE = "manifest.pb";

// Written under a temporary name and renamed, so readers never see a partial record
void save_message(const fs::path& path, const google::protobuf::Message& msg) {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open() || !msg.SerializeToOstream(&out)) {
            throw io_error("write", tmp.string());
        }
    }
    fs::rename(tmp, path);
}

void load_message(const fs::path& path, google::protobuf::Message& msg) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw Error(errc::not_found, "no such resource: " + path.filename().string());
    }
    if (!msg.ParseFromIstream(&in)) {
        throw std::runtime_error("corrupted record: " + path.string());
    }
}

void write_bytes(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw io_error("open", path.string());
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw io_error("write", path.string());
    }
}

// Strips "<prefix>" and "<suffix>" around an inclusive byte range
std::optional<ByteRange> parse_wrapped_range(const std::string& text, const std::string& prefix,
                                             const std::string& suffix) {
    if (text.size() < prefix.size() + suffix.size() ||
        text.compare(0, prefix.size(), prefix) != 0 ||
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    return ByteRange::parse(
        text.substr(prefix.size(), text.size() - prefix.size() - suffix.size()));
}

} // namespace

DirectoryVault::DirectoryVault(std::string root, std::size_t page_size)
    : root_(std::move(root)), page_size_(std::max<std::size_t>(page_size, 1)) {
    std::random_device rd;
    gen_.seed(rd());
}

std::string DirectoryVault::generate_id() {
    std::string random_data;
    {
        std::lock_guard<std::mutex> lock(id_mutex_);
        std::uniform_int_distribution<uint64_t> dis;
        random_data = std::to_string(dis(gen_)) + std::to_string(dis(gen_));
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(random_data.c_str()), random_data.length(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

fs::path DirectoryVault::vault_dir(const std::string& vault_name) const {
    fs::path dir = root_ / vault_name;
    if (vault_name.empty() || !fs::is_directory(dir)) {
        throw Error(errc::not_found, "vault " + vault_name + " does not exist");
    }
    return dir;
}

fs::path DirectoryVault::upload_dir(const std::string& vault_name,
                                    const std::string& upload_id) const {
    fs::path dir = vault_dir(vault_name) / "uploads" / upload_id;
    if (upload_id.empty() || !fs::is_regular_file(dir / MANIFEST_FILE)) {
        throw Error(errc::not_found, "upload " + upload_id + " does not exist");
    }
    return dir;
}

void DirectoryVault::create_vault(const std::string& vault_name) {
    if (vault_name.empty() || vault_name.find('/') != std::string::npos) {
        throw std::invalid_argument("invalid vault name: " + vault_name);
    }
    fs::path dir = root_ / vault_name;
    fs::create_directories(dir / "uploads");
    fs::create_directories(dir / "archives");
    fs::create_directories(dir / "jobs");
    std::cout << "[DirectoryVault] vault " << vault_name << " is ready at " << dir << std::endl;
}

std::string DirectoryVault::initiate_multipart_upload(const std::string& /*account_id*/,
                                                      const std::string& vault_name,
                                                      int64_t part_size) {
    if (part_size <= 0) {
        throw std::invalid_argument("part size must be positive");
    }

    std::string upload_id = generate_id();
    fs::path dir = vault_dir(vault_name) / "uploads" / upload_id;
    fs::create_directories(dir);

    proto::UploadManifest manifest;
    manifest.set_part_size(part_size);
    save_message(dir / MANIFEST_FILE, manifest);

    std::cout << "[DirectoryVault] initiated upload " << upload_id << " in " << vault_name
              << std::endl;
    return upload_id;
}

std::vector<proto::PartRecord> DirectoryVault::load_parts(const fs::path& dir) const {
    std::vector<std::pair<int64_t, proto::PartRecord>> parts;
    for (const auto& entry : fs::directory_iterator(dir)) {
        const fs::path& path = entry.path();
        if (path.extension() != ".pb" || path.filename() == MANIFEST_FILE) {
            continue;
        }
        proto::PartRecord part;
        load_message(path, part);
        std::optional<ByteRange> range = ByteRange::parse(part.range_in_bytes());
        if (!range) {
            throw std::runtime_error("corrupted part record: " + path.string());
        }
        parts.emplace_back(range->offset(), std::move(part));
    }

    std::sort(parts.begin(), parts.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<proto::PartRecord> sorted;
    sorted.reserve(parts.size());
    for (auto& p : parts) {
        sorted.push_back(std::move(p.second));
    }
    return sorted;
}

proto::PartListPage DirectoryVault::list_parts(const std::string& /*account_id*/,
                                               const std::string& vault_name,
                                               const std::string& upload_id,
                                               const std::string& marker) {
    fs::path dir = upload_dir(vault_name, upload_id);

    proto::UploadManifest manifest;
    load_message(dir / MANIFEST_FILE, manifest);

    std::vector<proto::PartRecord> parts = load_parts(dir);

    std::size_t start = 0;
    if (!marker.empty()) {
        if (!std::all_of(marker.begin(), marker.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("invalid marker: " + marker);
        }
        start = static_cast<std::size_t>(std::stoull(marker));
    }

    proto::PartListPage page;
    page.set_part_size(manifest.part_size());

    std::size_t end = std::min(parts.size(), start + page_size_);
    for (std::size_t i = start; i < end; ++i) {
        *page.add_parts() = parts[i];
    }
    if (end < parts.size()) {
        page.set_marker(std::to_string(end));
    }
    return page;
}

void DirectoryVault::upload_multipart_part(const std::string& /*account_id*/,
                                           const std::string& vault_name,
                                           const std::string& upload_id,
                                           const std::string& range, const std::string& checksum,
                                           const std::string& body) {
    fs::path dir = upload_dir(vault_name, upload_id);

    proto::UploadManifest manifest;
    load_message(dir / MANIFEST_FILE, manifest);

    std::optional<ByteRange> part_range = parse_wrapped_range(range, "bytes ", "/*");
    if (!part_range) {
        throw Error(errc::invalid_range, "content range (" + range + ") is invalid");
    }
    if (part_range->offset() % manifest.part_size() != 0 ||
        part_range->length() > manifest.part_size()) {
        throw Error(errc::invalid_range,
                    "content range (" + range + ") does not match the part size");
    }
    if (static_cast<int64_t>(body.size()) != part_range->length()) {
        throw Error(errc::size_mismatch, "body size does not match content range " + range);
    }

    std::optional<std::string> tree_hash = compute_tree_hash(body);
    if (!tree_hash || *tree_hash != checksum) {
        throw Error(errc::hash_mismatch, "checksum of part (" + part_range->to_string() +
                                             ") does not match its body");
    }

    std::string name = std::to_string(part_range->offset());
    write_bytes(dir / (name + ".part"), body);

    proto::PartRecord record;
    record.set_range_in_bytes(part_range->to_string());
    record.set_tree_hash(*tree_hash);
    save_message(dir / (name + ".pb"), record);
}

std::string DirectoryVault::complete_multipart_upload(const std::string& account_id,
                                                      const std::string& vault_name,
                                                      const std::string& upload_id,
                                                      int64_t archive_size,
                                                      const std::string& checksum) {
    fs::path dir = upload_dir(vault_name, upload_id);
    std::vector<proto::PartRecord> parts = load_parts(dir);

    // Parts must tile [0, archive_size) without gaps
    int64_t expected = 0;
    for (const auto& part : parts) {
        ByteRange range = *ByteRange::parse(part.range_in_bytes());
        if (range.offset() != expected) {
            throw Error(errc::incomplete_upload,
                        "missing part at offset " + std::to_string(expected));
        }
        expected = range.end();
    }
    if (expected != archive_size) {
        throw Error(errc::incomplete_upload,
                    "archive size " + std::to_string(archive_size) + " does not match " +
                        std::to_string(expected) + " uploaded bytes");
    }

    std::string archive_id = generate_id();
    fs::path archives = vault_dir(vault_name) / "archives";
    fs::path tmp = archives / (archive_id + ".tmp");

    TreeHasher hasher;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw io_error("open", tmp.string());
        }
        for (const auto& part : parts) {
            ByteRange range = *ByteRange::parse(part.range_in_bytes());
            ArchiveFile part_file = ArchiveFile::open_for_reading(
                (dir / (std::to_string(range.offset()) + ".part")).string());
            std::string data = part_file.read(ByteRange(0, range.length()));
            hasher.update(data.data(), data.size());
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
        }
        if (!out) {
            throw io_error("write", tmp.string());
        }
    }

    std::optional<std::string> tree_hash = hasher.finish();
    if (!tree_hash || *tree_hash != checksum) {
        fs::remove(tmp);
        throw Error(errc::hash_mismatch, "archive checksum does not match the uploaded parts");
    }

    fs::rename(tmp, archives / archive_id);

    proto::ArchiveManifest manifest;
    manifest.set_size(archive_size);
    manifest.set_tree_hash(*tree_hash);
    save_message(archives / (archive_id + ".pb"), manifest);

    fs::remove_all(dir);

    std::cout << "[DirectoryVault] completed upload " << upload_id << " as archive " << archive_id
              << std::endl;
    return "/" + account_id + "/vaults/" + vault_name + "/archives/" + archive_id;
}

std::string DirectoryVault::initiate_retrieval(const std::string& /*account_id*/,
                                               const std::string& vault_name,
                                               const std::string& archive_id) {
    fs::path dir = vault_dir(vault_name);

    proto::ArchiveManifest archive;
    load_message(dir / "archives" / (archive_id + ".pb"), archive);

    proto::JobManifest job;
    job.set_archive_id(archive_id);
    proto::JobDescription* description = job.mutable_description();
    description->set_action("ArchiveRetrieval");
    description->set_status_code("Succeeded");
    description->set_archive_size(archive.size());
    description->set_tree_hash(archive.tree_hash());

    std::string job_id = generate_id();
    save_message(dir / "jobs" / (job_id + ".pb"), job);

    std::cout << "[DirectoryVault] retrieval job " << job_id << " for archive " << archive_id
              << std::endl;
    return job_id;
}

proto::JobDescription DirectoryVault::describe_job(const std::string& /*account_id*/,
                                                   const std::string& vault_name,
                                                   const std::string& job_id) {
    proto::JobManifest job;
    load_message(vault_dir(vault_name) / "jobs" / (job_id + ".pb"), job);
    return job.description();
}

proto::JobOutput DirectoryVault::get_job_output(const std::string& /*account_id*/,
                                                const std::string& vault_name,
                                                const std::string& job_id,
                                                const std::string& range) {
    fs::path dir = vault_dir(vault_name);

    proto::JobManifest job;
    load_message(dir / "jobs" / (job_id + ".pb"), job);

    std::optional<ByteRange> requested = parse_wrapped_range(range, "bytes=", "");
    if (!requested) {
        throw Error(errc::invalid_range, "range (" + range + ") is invalid");
    }

    ArchiveFile archive =
        ArchiveFile::open_for_reading((dir / "archives" / job.archive_id()).string());
    int64_t archive_size = archive.size();
    if (requested->end() > archive_size) {
        throw Error(errc::invalid_range, "range (" + range + ") is not satisfiable");
    }

    proto::JobOutput output;
    output.set_body(archive.read(*requested));

    // Checksums are only served for tree-hash aligned ranges
    bool aligned = requested->offset() % TREE_HASH_CHUNK_SIZE == 0 &&
                   (requested->length() % TREE_HASH_CHUNK_SIZE == 0 ||
                    requested->end() == archive_size);
    if (aligned) {
        std::optional<std::string> tree_hash = compute_tree_hash(output.body());
        if (tree_hash) {
            output.set_checksum(*tree_hash);
        }
    }
    return output;
}

} // namespace icepack
