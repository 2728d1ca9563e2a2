#pragma once

#include "icepack.pb.h"
#include <cstdint>
#include <string>

namespace icepack {

// Account id meaning "the account of the credentials in use"
const std::string DEFAULT_ACCOUNT_ID = "-";

constexpr int64_t DEFAULT_PART_SIZE = 1024 * 1024;

// What the transfer engine needs from the archival service. Implementations
// report failures by throwing; the engine passes those exceptions through.
// Methods may be called from several threads at once.
class VaultClient {
public:
    virtual ~VaultClient() = default;

    // Starts a multipart upload and returns its upload id
    virtual std::string initiate_multipart_upload(const std::string& account_id,
                                                  const std::string& vault_name,
                                                  int64_t part_size) = 0;

    // One page of the parts stored so far. An empty marker asks for the first page.
    virtual proto::PartListPage list_parts(const std::string& account_id,
                                           const std::string& vault_name,
                                           const std::string& upload_id,
                                           const std::string& marker) = 0;

    // `range` is the content range, e.g. "bytes 0-1048575/*"
    virtual void upload_multipart_part(const std::string& account_id,
                                       const std::string& vault_name,
                                       const std::string& upload_id,
                                       const std::string& range,
                                       const std::string& checksum,
                                       const std::string& body) = 0;

    // Returns the location of the new archive
    virtual std::string complete_multipart_upload(const std::string& account_id,
                                                  const std::string& vault_name,
                                                  const std::string& upload_id,
                                                  int64_t archive_size,
                                                  const std::string& checksum) = 0;

    virtual proto::JobDescription describe_job(const std::string& account_id,
                                               const std::string& vault_name,
                                               const std::string& job_id) = 0;

    // `range` is an HTTP byte range, e.g. "bytes=0-1048575"
    virtual proto::JobOutput get_job_output(const std::string& account_id,
                                            const std::string& vault_name,
                                            const std::string& job_id,
                                            const std::string& range) = 0;
};

// Walks every page of a part listing, fetching lazily:
//
//   PartPager pager(client, account, vault, upload_id);
//   while (pager.next()) { use(pager.page()); }
class PartPager {
public:
    PartPager(VaultClient& client, std::string account_id, std::string vault_name,
              std::string upload_id);

    // Fetches the next page. Returns false once the last page was consumed.
    bool next();

    const proto::PartListPage& page() const { return page_; }

private:
    VaultClient& client_;
    std::string account_id_;
    std::string vault_name_;
    std::string upload_id_;

    proto::PartListPage page_;
    bool started_ = false;
};

} // namespace icepack
