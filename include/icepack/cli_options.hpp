#pragma once

#include "icepack/vault_client.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace icepack {

struct CliOptions {
    std::string command; // "upload", "download", "retrieve" or "mkvault"

    // Directory vault root
    std::string root = ".";
    std::string account_id = DEFAULT_ACCOUNT_ID;
    int64_t part_size = DEFAULT_PART_SIZE;
    std::size_t jobs = 1;

    std::string upload_id; // upload only
    std::string job_id;    // download only, required

    std::string vault_name;
    std::string target; // FILE for upload/download, ARCHIVE_ID for retrieve
};

std::string usage(const std::string& program);

// Part sizes accepted by the service: 1 MiB times a power of two, up to 4 GiB
bool is_valid_part_size(int64_t part_size);

// Parses argv (without the program name). `env_root` is the value of
// ICEPACK_ROOT or nullptr; --root overrides it. Throws std::invalid_argument
// with a short reason on bad input.
CliOptions parse_cli_options(const std::vector<std::string>& args, const char* env_root,
                             std::size_t default_jobs);

} // namespace icepack
