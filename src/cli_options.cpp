#include "icepack/cli_options.hpp"
#include <stdexcept>

namespace icepack {

namespace {

int64_t parse_number(const std::string& option, const std::string& value) {
    size_t pos = 0;
    long long n = 0;
    try {
        n = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a number, got \"" + value + "\"");
    }
    if (pos != value.size() || n <= 0) {
        throw std::invalid_argument(option + " expects a positive number, got \"" + value + "\"");
    }
    return n;
}

} // namespace

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options] <command> [command options] VAULT FILE\n"
           "\n"
           "Multipart upload and download of cold storage archives\n"
           "\n"
           "Options:\n"
           "  --root DIR         vault root directory (default: $ICEPACK_ROOT or .)\n"
           "  --account-id ID    the account ID of the account that owns the vault (default \"-\")\n"
           "  --part-size N      the size of each part except the last, in bytes (default 1048576)\n"
           "  --jobs N           the maximum number of the parallel jobs\n"
           "\n"
           "Commands:\n"
           "  upload [--upload-id ID] VAULT FILE   upload a file, or resume upload ID\n"
           "  download --job-id ID VAULT FILE      download the output of a retrieval job\n"
           "  retrieve VAULT ARCHIVE_ID            start a retrieval job for an archive\n"
           "  mkvault VAULT                        create a vault\n";
}

bool is_valid_part_size(int64_t part_size) {
    const int64_t mib = 1024 * 1024;
    if (part_size < mib || part_size > 4096 * mib || part_size % mib != 0) {
        return false;
    }
    int64_t multiple = part_size / mib;
    return (multiple & (multiple - 1)) == 0;
}

CliOptions parse_cli_options(const std::vector<std::string>& args, const char* env_root,
                             std::size_t default_jobs) {
    CliOptions opts;
    if (env_root != nullptr && *env_root != '\0') {
        opts.root = env_root;
    }
    opts.jobs = default_jobs > 0 ? default_jobs : 1;

    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            const std::string& value = args[++i];

            // Command options are only valid after their command
            if (arg == "--root") {
                opts.root = value;
            } else if (arg == "--account-id") {
                opts.account_id = value;
            } else if (arg == "--part-size") {
                opts.part_size = parse_number(arg, value);
            } else if (arg == "--jobs") {
                opts.jobs = static_cast<std::size_t>(parse_number(arg, value));
            } else if (arg == "--upload-id" && opts.command == "upload") {
                opts.upload_id = value;
            } else if (arg == "--job-id" && opts.command == "download") {
                opts.job_id = value;
            } else {
                throw std::invalid_argument("unknown option " + arg);
            }
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            positional.push_back(arg);
        }
    }

    if (opts.command.empty()) {
        throw std::invalid_argument("missing command");
    }
    if (opts.command != "upload" && opts.command != "download" && opts.command != "retrieve" &&
        opts.command != "mkvault") {
        throw std::invalid_argument("unknown command " + opts.command);
    }

    size_t expected = opts.command == "mkvault" ? 1 : 2;
    if (positional.size() != expected) {
        throw std::invalid_argument(opts.command + " expects " + std::to_string(expected) +
                                    " arguments");
    }
    opts.vault_name = positional[0];
    if (expected == 2) {
        opts.target = positional[1];
    }

    if (opts.command == "download" && opts.job_id.empty()) {
        throw std::invalid_argument("download requires --job-id");
    }
    if (!is_valid_part_size(opts.part_size)) {
        throw std::invalid_argument("--part-size must be 1 MiB times a power of two, up to 4 GiB");
    }
    return opts;
}

} // namespace icepack
