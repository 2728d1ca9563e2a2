#include "icepack/vault_client.hpp"

namespace icepack {

PartPager::PartPager(VaultClient& client, std::string account_id, std::string vault_name,
                     std::string upload_id)
    : client_(client),
      account_id_(std::move(account_id)),
      vault_name_(std::move(vault_name)),
      upload_id_(std::move(upload_id)) {}

bool PartPager::next() {
    if (started_ && page_.marker().empty()) {
        return false;
    }

    std::string marker = started_ ? page_.marker() : std::string();
    page_ = client_.list_parts(account_id_, vault_name_, upload_id_, marker);
    started_ = true;
    return true;
}

} // namespace icepack
