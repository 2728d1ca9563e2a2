#pragma once

#include <openssl/evp.h>
#include <openssl/sha.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace icepack {

// Leaf size of the tree hash (1 MiB)
constexpr int64_t TREE_HASH_CHUNK_SIZE = 1024 * 1024;

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Incremental SHA-256 tree hash. Bytes are cut into 1 MiB leaves counted from
// the first byte passed to update(), regardless of how the input is split
// across calls. Only the 32-byte leaf digests are kept in memory.
class TreeHasher {
public:
    TreeHasher();

    TreeHasher(const TreeHasher&) = delete;
    TreeHasher& operator=(const TreeHasher&) = delete;

    void update(const char* data, std::size_t len);

    // Hex digest of everything fed so far, or std::nullopt if nothing was.
    // The hasher is reset afterwards.
    std::optional<std::string> finish();

    int64_t bytes_hashed() const { return total_; }

private:
    void start_leaf();
    void finish_leaf();

    EVP_MD_CTX_ptr leaf_ctx_;
    int64_t leaf_fill_ = 0;
    int64_t total_ = 0;
    std::vector<std::string> leaves_;
};

// Tree hash of an in-memory buffer
std::optional<std::string> compute_tree_hash(const std::string& data);

} // namespace icepack
