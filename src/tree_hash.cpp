#include "icepack/tree_hash.hpp"
#include "icepack/hex_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace icepack {

namespace {

std::string sha256(const unsigned char* data, size_t len) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, len, hash);
    return std::string(reinterpret_cast<const char*>(hash), SHA256_DIGEST_LENGTH);
}

// Hash of the concatenation of two raw child digests
std::string combine(const std::string& left, const std::string& right) {
    std::string joined = left + right;
    return sha256(reinterpret_cast<const unsigned char*>(joined.data()), joined.size());
}

} // namespace

TreeHasher::TreeHasher() : leaf_ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (!leaf_ctx_) {
        throw std::runtime_error("could not allocate digest context");
    }
}

void TreeHasher::start_leaf() {
    if (EVP_DigestInit_ex(leaf_ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("could not initialize SHA-256 digest");
    }
    leaf_fill_ = 0;
}

void TreeHasher::finish_leaf() {
    std::string digest(EVP_MAX_MD_SIZE, '\0');
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(leaf_ctx_.get(), reinterpret_cast<unsigned char*>(&digest[0]),
                           &hash_len) != 1) {
        throw std::runtime_error("could not finalize SHA-256 digest");
    }
    digest.resize(hash_len);
    leaves_.push_back(std::move(digest));
    leaf_fill_ = 0;
}

void TreeHasher::update(const char* data, std::size_t len) {
    while (len > 0) {
        if (leaf_fill_ == 0) {
            start_leaf();
        }

        size_t take = static_cast<size_t>(
            std::min<int64_t>(static_cast<int64_t>(len), TREE_HASH_CHUNK_SIZE - leaf_fill_));
        if (EVP_DigestUpdate(leaf_ctx_.get(), data, take) != 1) {
            throw std::runtime_error("could not update SHA-256 digest");
        }
        leaf_fill_ += take;
        total_ += take;
        data += take;
        len -= take;

        if (leaf_fill_ == TREE_HASH_CHUNK_SIZE) {
            finish_leaf();
        }
    }
}

std::optional<std::string> TreeHasher::finish() {
    if (leaf_fill_ > 0) {
        finish_leaf();
    }

    std::vector<std::string> level;
    level.swap(leaves_);
    total_ = 0;

    if (level.empty()) {
        return std::nullopt;
    }

    // Pair adjacent nodes left to right; an odd one out moves up unchanged
    while (level.size() > 1) {
        std::vector<std::string> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i + 1 < level.size(); i += 2) {
            next.push_back(combine(level[i], level[i + 1]));
        }
        if (level.size() % 2 == 1) {
            next.push_back(std::move(level.back()));
        }
        level.swap(next);
    }

    return to_hex(level.front());
}

std::optional<std::string> compute_tree_hash(const std::string& data) {
    TreeHasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish();
}

} // namespace icepack
