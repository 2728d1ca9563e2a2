#include <gtest/gtest.h>

#include "icepack/directory_vault.hpp"
#include "icepack/downloader.hpp"
#include "icepack/errors.hpp"
#include "icepack/tree_hash.hpp"
#include "icepack/uploader.hpp"
#include "test_support.hpp"

using namespace icepack;

namespace {

const std::string TEST_HASH = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";

std::string archive_id_of(const std::string& location) {
    return location.substr(location.rfind('/') + 1);
}

} // namespace

class DirectoryVaultTest : public ::testing::Test {
protected:
    DirectoryVaultTest() : vault_((dir_.path() / "root").string(), 2) {
        vault_.create_vault("photos");
    }

    UploadInput upload_input(const std::string& data, int64_t part_size) {
        std::string path = dir_.file("source");
        test::write_file(path, data);

        UploadInput input;
        input.vault_name = "photos";
        input.file_name = path;
        input.part_size = part_size;
        return input;
    }

    DownloadInput download_input(const std::string& job_id, int64_t part_size) {
        DownloadInput input;
        input.vault_name = "photos";
        input.file_name = dir_.file("restored");
        input.job_id = job_id;
        input.part_size = part_size;
        return input;
    }

    test::TempDir dir_;
    DirectoryVault vault_;
};

TEST_F(DirectoryVaultTest, RoundTripsSmallArchive) {
    Uploader uploader(vault_, upload_input("test", 1024 * 1024));
    std::string location = uploader.upload(1);
    EXPECT_EQ(location.rfind("/-/vaults/photos/archives/", 0), 0u);

    std::string job_id = vault_.initiate_retrieval("-", "photos", archive_id_of(location));
    proto::JobDescription job = vault_.describe_job("-", "photos", job_id);
    EXPECT_EQ(job.action(), "ArchiveRetrieval");
    EXPECT_EQ(job.status_code(), "Succeeded");
    EXPECT_EQ(job.archive_size(), 4);
    EXPECT_EQ(job.tree_hash(), TEST_HASH);

    Downloader downloader(vault_, download_input(job_id, 1024 * 1024));
    downloader.download(1);
    EXPECT_EQ(test::read_file(dir_.file("restored")), "test");
}

TEST_F(DirectoryVaultTest, RoundTripsMultiMebibyteArchive) {
    const int64_t mib = TREE_HASH_CHUNK_SIZE;
    std::string data = test::random_bytes(static_cast<size_t>(5 * mib + 333));

    Uploader uploader(vault_, upload_input(data, mib));
    std::string location = uploader.upload(3);

    std::string job_id = vault_.initiate_retrieval("-", "photos", archive_id_of(location));
    Downloader downloader(vault_, download_input(job_id, 2 * mib));
    downloader.download(2);
    EXPECT_EQ(test::read_file(dir_.file("restored")), data);
}

TEST_F(DirectoryVaultTest, ListsPartsAcrossPages) {
    std::string data = test::random_bytes(50);
    std::string upload_id = vault_.initiate_multipart_upload("-", "photos", 10);
    for (int64_t offset = 0; offset < 50; offset += 10) {
        std::string body = data.substr(static_cast<size_t>(offset), 10);
        vault_.upload_multipart_part("-", "photos", upload_id,
                                     "bytes " + ByteRange(offset, 10).to_string() + "/*",
                                     *compute_tree_hash(body), body);
    }

    std::vector<std::string> ranges;
    PartPager pager(vault_, "-", "photos", upload_id);
    int pages = 0;
    while (pager.next()) {
        ++pages;
        EXPECT_EQ(pager.page().part_size(), 10);
        for (const auto& part : pager.page().parts()) {
            ranges.push_back(part.range_in_bytes());
        }
    }
    EXPECT_EQ(pages, 3);
    EXPECT_EQ(ranges, (std::vector<std::string>{"0-9", "10-19", "20-29", "30-39", "40-49"}));
}

TEST_F(DirectoryVaultTest, ResumesInterruptedUpload) {
    std::string data = test::random_bytes(100);
    UploadInput input = upload_input(data, 10);

    // A previous run stored three of ten parts, one of them from an older file
    std::string upload_id = vault_.initiate_multipart_upload("-", "photos", 10);
    for (int64_t offset : {0, 30, 90}) {
        std::string body = offset == 30 ? std::string(10, 'z')
                                        : data.substr(static_cast<size_t>(offset), 10);
        vault_.upload_multipart_part("-", "photos", upload_id,
                                     "bytes " + ByteRange(offset, 10).to_string() + "/*",
                                     *compute_tree_hash(body), body);
    }

    input.upload_id = upload_id;
    Uploader uploader(vault_, input);
    std::string location = uploader.upload(4);

    std::string job_id = vault_.initiate_retrieval("-", "photos", archive_id_of(location));
    Downloader downloader(vault_, download_input(job_id, 16));
    downloader.download(4);
    EXPECT_EQ(test::read_file(dir_.file("restored")), data);
}

TEST_F(DirectoryVaultTest, ResumeWithOtherPartSizeFails) {
    std::string upload_id = vault_.initiate_multipart_upload("-", "photos", 20);
    UploadInput input = upload_input("test", 10);
    input.upload_id = upload_id;

    Uploader uploader(vault_, input);
    try {
        uploader.upload(1);
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), errc::part_size_mismatch);
    }
}

TEST_F(DirectoryVaultTest, RejectsPartWithWrongChecksum) {
    std::string upload_id = vault_.initiate_multipart_upload("-", "photos", 4);
    try {
        vault_.upload_multipart_part("-", "photos", upload_id, "bytes 0-3/*", "bad", "test");
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), errc::hash_mismatch);
    }
}

TEST_F(DirectoryVaultTest, RejectsMisalignedPart) {
    std::string upload_id = vault_.initiate_multipart_upload("-", "photos", 4);
    EXPECT_THROW(
        vault_.upload_multipart_part("-", "photos", upload_id, "bytes 2-5/*", TEST_HASH, "test"),
        Error);
    EXPECT_THROW(
        vault_.upload_multipart_part("-", "photos", upload_id, "0-3", TEST_HASH, "test"), Error);
}

TEST_F(DirectoryVaultTest, CompletionRequiresEveryPart) {
    std::string upload_id = vault_.initiate_multipart_upload("-", "photos", 4);
    vault_.upload_multipart_part("-", "photos", upload_id, "bytes 4-7/*", TEST_HASH, "test");

    try {
        vault_.complete_multipart_upload("-", "photos", upload_id, 8,
                                         *compute_tree_hash("testtest"));
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), errc::incomplete_upload);
    }
}

TEST_F(DirectoryVaultTest, CompletionChecksArchiveHash) {
    std::string upload_id = vault_.initiate_multipart_upload("-", "photos", 4);
    vault_.upload_multipart_part("-", "photos", upload_id, "bytes 0-3/*", TEST_HASH, "test");

    try {
        vault_.complete_multipart_upload("-", "photos", upload_id, 4, "bad");
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), errc::hash_mismatch);
    }

    // The upload is still there and can be completed properly
    std::string location = vault_.complete_multipart_upload("-", "photos", upload_id, 4, TEST_HASH);
    EXPECT_FALSE(location.empty());
}

TEST_F(DirectoryVaultTest, JobOutputChecksumOnlyForAlignedRanges) {
    const int64_t mib = TREE_HASH_CHUNK_SIZE;
    std::string data = test::random_bytes(static_cast<size_t>(2 * mib + 10));

    Uploader uploader(vault_, upload_input(data, mib));
    std::string job_id =
        vault_.initiate_retrieval("-", "photos", archive_id_of(uploader.upload(2)));

    proto::JobOutput first = vault_.get_job_output("-", "photos", job_id,
                                                   "bytes=" + ByteRange(0, mib).to_string());
    ASSERT_TRUE(first.has_checksum());
    EXPECT_EQ(first.checksum(), compute_tree_hash(data.substr(0, static_cast<size_t>(mib))));

    proto::JobOutput tail = vault_.get_job_output("-", "photos", job_id,
                                                  "bytes=" + ByteRange(2 * mib, 10).to_string());
    EXPECT_TRUE(tail.has_checksum());

    proto::JobOutput unaligned = vault_.get_job_output("-", "photos", job_id, "bytes=5-104");
    EXPECT_FALSE(unaligned.has_checksum());
    EXPECT_EQ(unaligned.body(), data.substr(5, 100));

    EXPECT_THROW(vault_.get_job_output("-", "photos", job_id,
                                       "bytes=" + ByteRange(2 * mib, 11).to_string()),
                 Error);
}

TEST_F(DirectoryVaultTest, UnknownResourcesAreNotFound) {
    try {
        vault_.describe_job("-", "photos", "nope");
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), errc::not_found);
    }
    EXPECT_THROW(vault_.initiate_multipart_upload("-", "missing", 4), Error);
    EXPECT_THROW(vault_.list_parts("-", "photos", "nope", ""), Error);
}
