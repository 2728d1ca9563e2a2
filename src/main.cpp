#include <iostream>
#include <cstdlib>
#include <thread>
#include "icepack/cli_options.hpp"
#include "icepack/directory_vault.hpp"
#include "icepack/downloader.hpp"
#include "icepack/uploader.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    icepack::CliOptions opts;
    try {
        opts = icepack::parse_cli_options(args, std::getenv("ICEPACK_ROOT"),
                                          std::thread::hardware_concurrency());
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << icepack::usage(argv[0]);
        return 2;
    }

    try {
        icepack::DirectoryVault vault(opts.root);

        if (opts.command == "mkvault") {
            vault.create_vault(opts.vault_name);
        } else if (opts.command == "upload") {
            icepack::UploadInput input;
            input.account_id = opts.account_id;
            input.vault_name = opts.vault_name;
            input.file_name = opts.target;
            input.upload_id = opts.upload_id;
            input.part_size = opts.part_size;

            icepack::Uploader uploader(vault, input);
            std::cout << uploader.upload(opts.jobs) << std::endl;
        } else if (opts.command == "download") {
            icepack::DownloadInput input;
            input.account_id = opts.account_id;
            input.vault_name = opts.vault_name;
            input.file_name = opts.target;
            input.job_id = opts.job_id;
            input.part_size = opts.part_size;

            icepack::Downloader downloader(vault, input);
            downloader.download(opts.jobs);
        } else if (opts.command == "retrieve") {
            std::cout << vault.initiate_retrieval(opts.account_id, opts.vault_name, opts.target)
                      << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
