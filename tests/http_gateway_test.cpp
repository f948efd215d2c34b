#include <gtest/gtest.h>
#include <httplib.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "http_gateway.hpp"
#include "memory_blob_store.hpp"
#include "s3_client.hpp"
#include "s3_xml.hpp"

namespace {

const char* kAccessKey = "AKIDGATEWAYTEST";
const char* kSecretKey = "gateway/test/secret";

} // namespace

class S3GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.auth_enabled = AuthEnabled();
        config_.access_key = kAccessKey;
        config_.secret_key = kSecretKey;
        config_.max_object_size = MaxObjectSize();

        engine_ = std::make_unique<StorageEngine>(std::make_unique<MemoryBlobStore>());
        gateway_ = std::make_unique<S3Gateway>(*engine_, config_);
        gateway_->Register(svr_);

        port_ = svr_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        server_thread_ = std::thread([this]() { svr_.listen_after_bind(); });
        for (int i = 0; i < 200 && !svr_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_TRUE(svr_.is_running());

        client_ = std::make_unique<httplib::Client>("127.0.0.1", port_);
    }

    void TearDown() override {
        svr_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    virtual bool AuthEnabled() const { return false; }
    virtual uint64_t MaxObjectSize() const { return 1024 * 1024; }

    std::string Endpoint() const { return "http://127.0.0.1:" + std::to_string(port_); }

    static std::string CodeOf(const httplib::Result& res) {
        std::vector<std::string> codes = ExtractElements(res->body, "Code");
        return codes.empty() ? "" : codes.front();
    }

    Config::ServerConfig config_;
    std::unique_ptr<StorageEngine> engine_;
    std::unique_ptr<S3Gateway> gateway_;
    httplib::Server svr_;
    std::thread server_thread_;
    int port_ = 0;
    std::unique_ptr<httplib::Client> client_;
};

TEST_F(S3GatewayTest, BucketLifecycle) {
    auto created = client_->Put("/photos", "", "application/xml");
    ASSERT_TRUE(created);
    EXPECT_EQ(200, created->status);
    EXPECT_EQ("/photos", created->get_header_value("Location"));

    auto again = client_->Put("/photos", "", "application/xml");
    ASSERT_TRUE(again);
    EXPECT_EQ(409, again->status);
    EXPECT_EQ("BucketAlreadyExists", CodeOf(again));

    auto head = client_->Head("/photos");
    ASSERT_TRUE(head);
    EXPECT_EQ(200, head->status);

    auto listed = client_->Get("/");
    ASSERT_TRUE(listed);
    EXPECT_EQ((std::vector<std::string>{"photos"}), ExtractElements(listed->body, "Name"));

    auto deleted = client_->Delete("/photos");
    ASSERT_TRUE(deleted);
    EXPECT_EQ(204, deleted->status);

    auto missing = client_->Head("/photos");
    ASSERT_TRUE(missing);
    EXPECT_EQ(404, missing->status);
}

TEST_F(S3GatewayTest, InvalidBucketName) {
    auto res = client_->Put("/Bad_Name", "", "application/xml");
    ASSERT_TRUE(res);
    EXPECT_EQ(400, res->status);
    EXPECT_EQ("InvalidBucketName", CodeOf(res));
}

TEST_F(S3GatewayTest, ObjectRoundTrip) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("mybucket"));
    const std::string body = "Hello World from Python";

    auto put = client_->Put("/mybucket/dir/sub/hello.txt", body, "text/plain");
    ASSERT_TRUE(put);
    EXPECT_EQ(200, put->status);
    std::string etag = put->get_header_value("ETag");
    EXPECT_EQ(34u, etag.size());

    auto get = client_->Get("/mybucket/dir/sub/hello.txt");
    ASSERT_TRUE(get);
    EXPECT_EQ(200, get->status);
    EXPECT_EQ(body, get->body);
    EXPECT_EQ(etag, get->get_header_value("ETag"));
    EXPECT_FALSE(get->get_header_value("Last-Modified").empty());

    auto head = client_->Head("/mybucket/dir/sub/hello.txt");
    ASSERT_TRUE(head);
    EXPECT_EQ(200, head->status);
    EXPECT_EQ(std::to_string(body.size()), head->get_header_value("Content-Length"));
    EXPECT_EQ(etag, head->get_header_value("ETag"));

    auto list = client_->Get("/mybucket");
    ASSERT_TRUE(list);
    EXPECT_EQ((std::vector<std::string>{"dir/sub/hello.txt"}), ExtractElements(list->body, "Key"));
    EXPECT_EQ((std::vector<std::string>{std::to_string(body.size())}), ExtractElements(list->body, "Size"));
}

TEST_F(S3GatewayTest, MissingResources) {
    auto no_bucket = client_->Get("/ghost/key");
    ASSERT_TRUE(no_bucket);
    EXPECT_EQ(404, no_bucket->status);
    EXPECT_EQ("NoSuchBucket", CodeOf(no_bucket));

    ASSERT_EQ(S3Error::None, engine_->CreateBucket("present"));
    auto no_key = client_->Get("/present/key");
    ASSERT_TRUE(no_key);
    EXPECT_EQ(404, no_key->status);
    EXPECT_EQ("NoSuchKey", CodeOf(no_key));
    EXPECT_EQ((std::vector<std::string>{"/present/key"}), ExtractElements(no_key->body, "Resource"));
}

TEST_F(S3GatewayTest, DeleteObjectIsIdempotent) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("bucket"));
    ASSERT_EQ(S3Error::None, engine_->PutObject("bucket", "k", "v"));

    for (int i = 0; i < 2; ++i) {
        auto res = client_->Delete("/bucket/k");
        ASSERT_TRUE(res);
        EXPECT_EQ(204, res->status);
    }
    EXPECT_EQ(0u, engine_->BlobCount());
}

TEST_F(S3GatewayTest, DeleteNonEmptyBucketConflicts) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("pair"));
    ASSERT_EQ(S3Error::None, engine_->PutObject("pair", "a", "1"));

    auto res = client_->Delete("/pair");
    ASSERT_TRUE(res);
    EXPECT_EQ(409, res->status);
    EXPECT_EQ("BucketNotEmpty", CodeOf(res));
}

TEST_F(S3GatewayTest, EntityTooLarge) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("bucket"));
    auto res = client_->Put("/bucket/big", std::string(config_.max_object_size + 1, 'x'), "application/octet-stream");
    ASSERT_TRUE(res);
    EXPECT_EQ(400, res->status);
    EXPECT_EQ("EntityTooLarge", CodeOf(res));
    EXPECT_EQ(0u, engine_->BlobCount());
}

TEST_F(S3GatewayTest, AwsChunkedUpload) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("bucket"));
    httplib::Headers headers = {
        {"x-amz-content-sha256", "STREAMING-UNSIGNED-PAYLOAD-TRAILER"},
        {"x-amz-decoded-content-length", "11"},
    };
    auto res = client_->Put("/bucket/chunked", headers, "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n",
                            "application/octet-stream");
    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);

    std::string data;
    ObjectMeta meta;
    ASSERT_EQ(S3Error::None, engine_->GetObject("bucket", "chunked", &data, &meta));
    EXPECT_EQ("hello world", data);
}

TEST_F(S3GatewayTest, AwsChunkedLengthMismatch) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("bucket"));
    httplib::Headers headers = {
        {"x-amz-content-sha256", "STREAMING-UNSIGNED-PAYLOAD-TRAILER"},
        {"x-amz-decoded-content-length", "12"},
    };
    auto res = client_->Put("/bucket/chunked", headers, "5\r\nhello\r\n0\r\n\r\n", "application/octet-stream");
    ASSERT_TRUE(res);
    EXPECT_EQ(400, res->status);
    EXPECT_EQ("InvalidArgument", CodeOf(res));

    auto bad = client_->Put("/bucket/chunked", headers, "not a chunk", "application/octet-stream");
    ASSERT_TRUE(bad);
    EXPECT_EQ(400, bad->status);
    EXPECT_EQ("InvalidRequest", CodeOf(bad));
    EXPECT_EQ(0u, engine_->BlobCount());
}

TEST_F(S3GatewayTest, PostNotAllowed) {
    auto res = client_->Post("/bucket/key", "x", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(405, res->status);
    EXPECT_EQ("MethodNotAllowed", CodeOf(res));
}

class S3GatewaySmallLimitTest : public S3GatewayTest {
protected:
    uint64_t MaxObjectSize() const override { return 1000; }
};

TEST_F(S3GatewaySmallLimitTest, BodyBeyondServerLimitGetsS3Error) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("bucket"));
    auto res = client_->Put("/bucket/huge", std::string(64 * 1024, 'x'), "application/octet-stream");
    ASSERT_TRUE(res);
    EXPECT_EQ(400, res->status);
    EXPECT_EQ("EntityTooLarge", CodeOf(res));
    EXPECT_EQ(0u, engine_->BlobCount());
}

TEST_F(S3GatewaySmallLimitTest, BodyJustOverObjectLimit) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("bucket"));
    auto over = client_->Put("/bucket/k", std::string(1001, 'x'), "application/octet-stream");
    ASSERT_TRUE(over);
    EXPECT_EQ(400, over->status);
    EXPECT_EQ("EntityTooLarge", CodeOf(over));

    auto at = client_->Put("/bucket/k", std::string(1000, 'x'), "application/octet-stream");
    ASSERT_TRUE(at);
    EXPECT_EQ(200, at->status);
}

TEST_F(S3GatewayTest, DeleteOfOverlongKeySucceeds) {
    ASSERT_EQ(S3Error::None, engine_->CreateBucket("bucket"));
    auto res = client_->Delete("/bucket/" + std::string(1025, 'k'));
    ASSERT_TRUE(res);
    EXPECT_EQ(204, res->status);
}

class S3GatewayAuthTest : public S3GatewayTest {
protected:
    bool AuthEnabled() const override { return true; }
};

TEST_F(S3GatewayAuthTest, UnsignedRequestRejected) {
    auto res = client_->Get("/");
    ASSERT_TRUE(res);
    EXPECT_EQ(403, res->status);
    EXPECT_EQ("MissingSecurityHeader", CodeOf(res));
}

TEST_F(S3GatewayAuthTest, WrongSecretRejected) {
    SigV4Credentials creds;
    creds.access_key = kAccessKey;
    creds.secret_key = "wrong";
    S3Client client(Endpoint(), creds);
    EXPECT_EQ(S3Error::SignatureDoesNotMatch, client.CreateBucket("mybucket"));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_->HeadBucket("mybucket"));
}

TEST_F(S3GatewayAuthTest, ClientScenario) {
    SigV4Credentials creds;
    creds.access_key = kAccessKey;
    creds.secret_key = kSecretKey;
    S3Client client(Endpoint(), creds);

    const std::string body = "Hello World from Python";
    ASSERT_EQ(S3Error::None, client.CreateBucket("mybucket"));
    EXPECT_EQ(S3Error::BucketAlreadyExists, client.CreateBucket("mybucket"));
    ASSERT_EQ(S3Error::None, client.PutObject("mybucket", "hello.txt", body));

    std::string downloaded;
    ASSERT_EQ(S3Error::None, client.GetObject("mybucket", "hello.txt", &downloaded));
    EXPECT_EQ(body, downloaded);

    std::vector<std::string> keys;
    ASSERT_EQ(S3Error::None, client.ListObjects("mybucket", &keys));
    EXPECT_EQ((std::vector<std::string>{"hello.txt"}), keys);

    ASSERT_EQ(S3Error::None, client.PutObject("mybucket", "second.bin", std::string("\0\x01\x02", 3)));
    EXPECT_EQ(S3Error::BucketNotEmpty, client.DeleteBucket("mybucket"));

    keys.clear();
    ASSERT_EQ(S3Error::None, client.ListObjects("mybucket", &keys));
    for (const auto& k : keys) {
        EXPECT_EQ(S3Error::None, client.DeleteObject("mybucket", k));
    }
    EXPECT_EQ(S3Error::None, client.DeleteBucket("mybucket"));
    EXPECT_EQ(S3Error::NoSuchBucket, client.GetObject("mybucket", "hello.txt", &downloaded));
}
