#include "dirsync/sync/transfer.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using dirsync::PathMapper;
using dirsync::network::HttpMethod;
using dirsync::network::HttpRequest;
using dirsync::network::HttpResponse;
using dirsync::sync::HttpFileTransfer;
using dirsync::sync::LocalDirectoryCreator;
using dirsync::test_support::FakeHttpClient;
using dirsync::test_support::create_temp_dir;
using dirsync::test_support::read_file;
using dirsync::test_support::write_file;

class HttpFileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("dirsync_transfer_test_");
        staging_ = root_ / ".dirsync" / "staging";
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    HttpFileTransfer make_transfer() {
        return HttpFileTransfer(http_, "http://sync.local:8080/", PathMapper(root_), staging_);
    }

    FakeHttpClient http_;
    fs::path root_;
    fs::path staging_;
};

TEST_F(HttpFileTransferTest, UploadSendsMultipartAndReturnsFileUrl) {
    write_file(root_ / "docs" / "report.txt", "quarterly numbers");
    http_.handler = [](const HttpRequest&) {
        return dirsync::Ok(FakeHttpClient::reply(200, R"({"file_url":"http://sync.local:8080/files/docs/report.txt"})"));
    };
    auto transfer = make_transfer();

    auto url = transfer.upload(root_ / "docs" / "report.txt", "laptop-1");
    ASSERT_TRUE(url.is_ok()) << url.error();
    EXPECT_EQ(url.value(), "http://sync.local:8080/files/docs/report.txt");

    ASSERT_EQ(http_.requests.size(), 1u);
    const auto& request = http_.requests[0];
    EXPECT_EQ(request.method, HttpMethod::POST);
    EXPECT_EQ(request.url, "http://sync.local:8080/upload");

    const auto content_type = request.headers.at("Content-Type");
    ASSERT_EQ(content_type.rfind("multipart/form-data; boundary=", 0), 0u);
    const auto boundary = content_type.substr(std::string("multipart/form-data; boundary=").size());
    EXPECT_NE(request.body.find("--" + boundary + "\r\n"), std::string::npos);
    EXPECT_NE(request.body.find("--" + boundary + "--\r\n"), std::string::npos);
    EXPECT_NE(request.body.find("name=\"client_id\"\r\n\r\nlaptop-1\r\n"), std::string::npos);
    EXPECT_NE(request.body.find("name=\"path\"\r\n\r\ndocs/report.txt\r\n"), std::string::npos);
    EXPECT_NE(request.body.find("filename=\"report.txt\""), std::string::npos);
    EXPECT_NE(request.body.find("quarterly numbers"), std::string::npos);
}

TEST_F(HttpFileTransferTest, UploadWithoutFileUrlFails) {
    write_file(root_ / "a.txt", "x");
    auto transfer = make_transfer();
    EXPECT_TRUE(transfer.upload(root_ / "a.txt", "laptop-1").is_error());
}

TEST_F(HttpFileTransferTest, UploadOfMissingFileFailsWithoutRequest) {
    auto transfer = make_transfer();
    EXPECT_TRUE(transfer.upload(root_ / "missing.txt", "laptop-1").is_error());
    EXPECT_TRUE(http_.requests.empty());
}

TEST_F(HttpFileTransferTest, UploadRejectedByServerFails) {
    write_file(root_ / "a.txt", "x");
    http_.handler = [](const HttpRequest&) {
        return dirsync::Ok(FakeHttpClient::reply(413, "too large"));
    };
    auto transfer = make_transfer();
    auto url = transfer.upload(root_ / "a.txt", "laptop-1");
    ASSERT_TRUE(url.is_error());
    EXPECT_NE(url.error().find("413"), std::string::npos);
}

TEST_F(HttpFileTransferTest, DownloadWritesIntoNestedDestination) {
    http_.handler = [](const HttpRequest&) {
        return dirsync::Ok(FakeHttpClient::reply(200, "remote bytes"));
    };
    auto transfer = make_transfer();

    auto result = transfer.download("photos/2024/my trip.jpg");
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(read_file(root_ / "photos" / "2024" / "my trip.jpg"), "remote bytes");
    EXPECT_FALSE(fs::exists(staging_ / "photos" / "2024" / "my trip.jpg"));

    ASSERT_EQ(http_.requests.size(), 1u);
    EXPECT_EQ(http_.requests[0].method, HttpMethod::GET);
    EXPECT_EQ(http_.requests[0].url, "http://sync.local:8080/files/photos/2024/my%20trip.jpg");
}

TEST_F(HttpFileTransferTest, DownloadOverwritesExistingFile) {
    write_file(root_ / "a.txt", "old");
    http_.handler = [](const HttpRequest&) {
        return dirsync::Ok(FakeHttpClient::reply(200, "new"));
    };
    auto transfer = make_transfer();

    ASSERT_TRUE(transfer.download("a.txt").is_ok());
    EXPECT_EQ(read_file(root_ / "a.txt"), "new");
}

TEST_F(HttpFileTransferTest, FailedDownloadLeavesDestinationUntouched) {
    write_file(root_ / "a.txt", "local");
    http_.handler = [](const HttpRequest&) {
        return dirsync::Ok(FakeHttpClient::reply(404, "no such file"));
    };
    auto transfer = make_transfer();

    EXPECT_TRUE(transfer.download("a.txt").is_error());
    EXPECT_EQ(read_file(root_ / "a.txt"), "local");
}

TEST_F(HttpFileTransferTest, DownloadRejectsEscapingPath) {
    auto transfer = make_transfer();
    EXPECT_TRUE(transfer.download("../outside.txt").is_error());
    EXPECT_TRUE(http_.requests.empty());
}

TEST(LocalDirectoryCreatorTest, CreatesNestedAndExistingDirectories) {
    const auto root = create_temp_dir("dirsync_mkdir_test_");
    LocalDirectoryCreator creator;

    EXPECT_TRUE(creator.make_directory(root / "a" / "b" / "c").is_ok());
    EXPECT_TRUE(fs::is_directory(root / "a" / "b" / "c"));
    EXPECT_TRUE(creator.make_directory(root / "a" / "b").is_ok());

    write_file(root / "file.txt", "x");
    EXPECT_TRUE(creator.make_directory(root / "file.txt").is_error());

    fs::remove_all(root);
}
