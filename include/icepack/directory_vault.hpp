#pragma once

#include "icepack/vault_client.hpp"
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace icepack {

// VaultClient that keeps vaults in a local directory tree:
//
//   <root>/<vault>/uploads/<upload id>/manifest.pb    UploadManifest
//   <root>/<vault>/uploads/<upload id>/<offset>.part  part bytes
//   <root>/<vault>/uploads/<upload id>/<offset>.pb    PartRecord
//   <root>/<vault>/archives/<archive id>              archive bytes
//   <root>/<vault>/archives/<archive id>.pb           ArchiveManifest
//   <root>/<vault>/jobs/<job id>.pb                   JobManifest
//
// It checks part checksums and archive completeness the way the remote
// service does, so it can stand in for it offline. The account id is only
// used to build archive locations.
class DirectoryVault : public VaultClient {
public:
    explicit DirectoryVault(std::string root, std::size_t page_size = 1000);

    void create_vault(const std::string& vault_name);

    // Starts a retrieval job for a stored archive. Jobs succeed immediately.
    std::string initiate_retrieval(const std::string& account_id, const std::string& vault_name,
                                   const std::string& archive_id);

    std::string initiate_multipart_upload(const std::string& account_id,
                                          const std::string& vault_name,
                                          int64_t part_size) override;

    proto::PartListPage list_parts(const std::string& account_id, const std::string& vault_name,
                                   const std::string& upload_id,
                                   const std::string& marker) override;

    void upload_multipart_part(const std::string& account_id, const std::string& vault_name,
                               const std::string& upload_id, const std::string& range,
                               const std::string& checksum, const std::string& body) override;

    std::string complete_multipart_upload(const std::string& account_id,
                                          const std::string& vault_name,
                                          const std::string& upload_id, int64_t archive_size,
                                          const std::string& checksum) override;

    proto::JobDescription describe_job(const std::string& account_id,
                                       const std::string& vault_name,
                                       const std::string& job_id) override;

    proto::JobOutput get_job_output(const std::string& account_id, const std::string& vault_name,
                                    const std::string& job_id, const std::string& range) override;

private:
    std::filesystem::path vault_dir(const std::string& vault_name) const;
    std::filesystem::path upload_dir(const std::string& vault_name,
                                     const std::string& upload_id) const;

    std::vector<proto::PartRecord> load_parts(const std::filesystem::path& dir) const;

    std::string generate_id();

    std::filesystem::path root_;
    std::size_t page_size_;

    std::mutex id_mutex_;
    std::mt19937_64 gen_;
};

} // namespace icepack
