#include "storage/S3WorkspaceStorage.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using wsync::storage::S3WorkspaceStorage;

// Runs against a real bucket when WSYNC_TEST_S3_BUCKET is set, e.g. a local MinIO:
//   WSYNC_TEST_S3_BUCKET=wsync-test WSYNC_TEST_S3_ENDPOINT=localhost:9000 WSYNC_TEST_S3_SECURE=false
//   WSYNC_TEST_S3_ACCESS_KEY=... WSYNC_TEST_S3_SECRET_KEY=...
class S3WorkspaceStorageIntegrationTest : public ::testing::Test {
  protected:
    std::unique_ptr<S3WorkspaceStorage> storage_;
    std::string prefix_;
    fs::path test_dir;

    static std::string env(const char* name, const std::string& def = "") {
        const char* v = std::getenv(name);
        return v && *v ? std::string(v) : def;
    }

    void SetUp() override {
        const auto bucket = env("WSYNC_TEST_S3_BUCKET");
        if (bucket.empty()) GTEST_SKIP() << "WSYNC_TEST_S3_BUCKET not set";

        wsync::config::S3Config cfg;
        cfg.bucket = bucket;
        cfg.endpoint = env("WSYNC_TEST_S3_ENDPOINT");
        cfg.region = env("WSYNC_TEST_S3_REGION", "us-east-1");
        cfg.access_key = env("WSYNC_TEST_S3_ACCESS_KEY");
        cfg.secret_key = env("WSYNC_TEST_S3_SECRET_KEY");
        cfg.secure = env("WSYNC_TEST_S3_SECURE", "true") != "false";
        storage_ = std::make_unique<S3WorkspaceStorage>(cfg);

        prefix_ = "wsync-it/" + std::to_string(::getpid());
        test_dir = fs::temp_directory_path() / ("wsync_s3_test_dir-" + std::to_string(::getpid()));
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (storage_) storage_->deleteDirectory(prefix_);
        if (!test_dir.empty()) fs::remove_all(test_dir);
    }

    static void writeTextFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }
};

TEST_F(S3WorkspaceStorageIntegrationTest, FileRoundTrip) {
    const auto local = test_dir / "simple test+1.txt";
    writeTextFile(local, "This is a test file for S3 upload.");
    const auto key = prefix_ + "/files/simple test+1.txt";

    storage_->uploadFile(local, key);
    EXPECT_TRUE(storage_->exists(key));
    EXPECT_TRUE(storage_->exists(prefix_ + "/files"));
    EXPECT_EQ(storage_->getFileSize(key), fs::file_size(local));

    const auto downloaded = test_dir / "out/downloaded.txt";
    storage_->downloadFile(key, downloaded);
    EXPECT_EQ(readFile(downloaded), readFile(local));

    storage_->deleteFile(key);
    EXPECT_FALSE(storage_->exists(key));
    EXPECT_FALSE(storage_->getFileSize(key));
    EXPECT_NO_THROW(storage_->deleteFile(key));
}

TEST_F(S3WorkspaceStorageIntegrationTest, MultipartUpload) {
    const auto local = test_dir / "big.bin";
    const std::string part(6 * 1024 * 1024, 'x');
    writeTextFile(local, part + part + part);

    auto cfg = storage_->config();
    cfg.multipart_threshold = 8 * 1024 * 1024;
    cfg.multipart_part_size = 5 * 1024 * 1024;
    S3WorkspaceStorage multipart(cfg);

    const auto key = prefix_ + "/big.bin";
    multipart.uploadFile(local, key);
    EXPECT_EQ(multipart.getFileSize(key), fs::file_size(local));
}

TEST_F(S3WorkspaceStorageIntegrationTest, DirectoryRoundTrip) {
    const auto src = test_dir / "src";
    writeTextFile(src / "a.txt", "a");
    writeTextFile(src / "nested/deeper/b.txt", "b");
    writeTextFile(src / "skip/c.txt", "c");

    storage_->uploadDirectory(src, prefix_ + "/dir", [](const std::string& rel) { return !rel.starts_with("skip/"); });

    auto keys = storage_->listFiles(prefix_ + "/dir");
    std::ranges::sort(keys);
    const std::vector<std::string> expected{prefix_ + "/dir/a.txt", prefix_ + "/dir/nested/deeper/b.txt"};
    EXPECT_EQ(keys, expected);

    const auto dst = test_dir / "dst";
    storage_->downloadDirectory(prefix_ + "/dir", dst);
    EXPECT_EQ(readFile(dst / "nested/deeper/b.txt"), "b");
    EXPECT_FALSE(fs::exists(dst / "skip"));

    storage_->deleteDirectory(prefix_ + "/dir");
    EXPECT_TRUE(storage_->listFiles(prefix_ + "/dir").empty());
}
