#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include "memory_blob_store.hpp"
#include "storage_engine.hpp"

namespace {

// Delegates to a MemoryBlobStore but can be told to fail the next Store().
class FlakyBlobStore : public BlobStore {
public:
    S3Error Store(const std::string& data, BlobInfo* info) override {
        if (fail_next_store) {
            fail_next_store = false;
            return S3Error::InternalStorageFailure;
        }
        return inner_.Store(data, info);
    }
    S3Error Fetch(const BlobRef& ref, std::string* data) override { return inner_.Fetch(ref, data); }
    S3Error Release(const BlobRef& ref) override { return inner_.Release(ref); }
    size_t Count() override { return inner_.Count(); }
    size_t MaxBlobSize() override { return max_blob_size; }

    bool fail_next_store = false;
    size_t max_blob_size = std::numeric_limits<size_t>::max();

private:
    MemoryBlobStore inner_;
};

std::vector<std::string> Keys(StorageEngine& engine, const std::string& bucket) {
    std::vector<ObjectSummary> objects;
    EXPECT_EQ(S3Error::None, engine.ListObjects(bucket, &objects));
    std::vector<std::string> keys;
    for (const auto& o : objects) {
        keys.push_back(o.key);
    }
    return keys;
}

} // namespace

class StorageEngineTest : public ::testing::Test {
protected:
    StorageEngineTest() : engine_(std::make_unique<MemoryBlobStore>()) {}

    StorageEngine engine_;
};

TEST_F(StorageEngineTest, CreateBucketTwice) {
    EXPECT_EQ(S3Error::None, engine_.CreateBucket("mybucket"));
    EXPECT_EQ(S3Error::BucketAlreadyExists, engine_.CreateBucket("mybucket"));
    EXPECT_EQ(S3Error::None, engine_.HeadBucket("mybucket"));
}

TEST_F(StorageEngineTest, RejectsInvalidBucketNames) {
    EXPECT_EQ(S3Error::InvalidBucketName, engine_.CreateBucket("ab"));
    EXPECT_EQ(S3Error::InvalidBucketName, engine_.CreateBucket("UpperCase"));
    EXPECT_EQ(S3Error::InvalidBucketName, engine_.CreateBucket("-leading"));
    EXPECT_EQ(S3Error::InvalidBucketName, engine_.CreateBucket("trailing."));
    EXPECT_EQ(S3Error::InvalidBucketName, engine_.CreateBucket(std::string(64, 'a')));
    EXPECT_EQ(S3Error::None, engine_.CreateBucket(std::string(63, 'a')));
    EXPECT_EQ(S3Error::None, engine_.CreateBucket("my.bucket-01"));
    EXPECT_TRUE(engine_.ListBuckets().size() == 2);
}

TEST_F(StorageEngineTest, OperationsOnMissingBucket) {
    std::string data;
    ObjectMeta meta;
    std::vector<ObjectSummary> objects;
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.HeadBucket("absent"));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.PutObject("absent", "k", "v"));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.GetObject("absent", "k", &data, &meta));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.HeadObject("absent", "k", &meta));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.ListObjects("absent", &objects));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.DeleteObject("absent", "k"));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.DeleteBucket("absent"));
    EXPECT_EQ(0u, engine_.BlobCount());
}

TEST_F(StorageEngineTest, MissingBucketReportedBeforeBadKey) {
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.PutObject("absent", "", "x"));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.PutObject("absent", std::string(1025, 'k'), "x"));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.PutObject("absent", "k", "x", 99));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.DeleteObject("absent", ""));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.DeleteObject("absent", std::string(1025, 'k')));
}

TEST_F(StorageEngineTest, OverwriteReplacesAndReleases) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));
    ASSERT_EQ(S3Error::None, engine_.PutObject("bucket", "k", "first version, longer"));
    ASSERT_EQ(S3Error::None, engine_.PutObject("bucket", "k", "second"));

    std::string data;
    ObjectMeta meta;
    ASSERT_EQ(S3Error::None, engine_.GetObject("bucket", "k", &data, &meta));
    EXPECT_EQ("second", data);
    EXPECT_EQ(6u, meta.size);
    EXPECT_EQ(1u, engine_.BlobCount());
}

TEST_F(StorageEngineTest, GetMissingKey) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));
    std::string data;
    ObjectMeta meta;
    EXPECT_EQ(S3Error::NoSuchKey, engine_.GetObject("bucket", "nope", &data, &meta));
    EXPECT_EQ(S3Error::NoSuchKey, engine_.HeadObject("bucket", "nope", &meta));
}

TEST_F(StorageEngineTest, DeleteNeverExistingKeySucceeds) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));
    EXPECT_EQ(S3Error::None, engine_.DeleteObject("bucket", "never-was"));
    EXPECT_EQ(S3Error::None, engine_.DeleteObject("bucket", "never-was"));
}

TEST_F(StorageEngineTest, ListingOrderIndependentOfInsertion) {
    std::vector<std::string> keys = {"delta", "alpha", "charlie", "bravo", "alpha/nested", "Zulu", "echo"};
    std::vector<std::string> expected = keys;
    std::sort(expected.begin(), expected.end());

    std::mt19937 rng(1234);
    for (int round = 0; round < 5; ++round) {
        StorageEngine engine(std::make_unique<MemoryBlobStore>());
        ASSERT_EQ(S3Error::None, engine.CreateBucket("ordered"));
        std::shuffle(keys.begin(), keys.end(), rng);
        for (const auto& k : keys) {
            ASSERT_EQ(S3Error::None, engine.PutObject("ordered", k, k));
        }
        EXPECT_EQ(expected, Keys(engine, "ordered"));
    }
}

TEST_F(StorageEngineTest, EmptyBucketListsNothing) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("empty"));
    EXPECT_TRUE(Keys(engine_, "empty").empty());
}

TEST_F(StorageEngineTest, RoundTripPayloads) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));

    std::string binary;
    for (int i = 0; i < 256; ++i) {
        binary.push_back(static_cast<char>(i));
    }
    std::string large(1 << 20, 'x');
    const std::vector<std::string> payloads = {"", binary, large, std::string("\0\0\0", 3)};

    for (size_t i = 0; i < payloads.size(); ++i) {
        std::string key = "obj-" + std::to_string(i);
        ObjectMeta put_meta;
        ASSERT_EQ(S3Error::None, engine_.PutObject("bucket", key, payloads[i], payloads[i].size(), &put_meta));

        std::string data;
        ObjectMeta meta;
        ASSERT_EQ(S3Error::None, engine_.GetObject("bucket", key, &data, &meta));
        EXPECT_EQ(payloads[i], data);
        EXPECT_EQ(payloads[i].size(), meta.size);
        EXPECT_EQ(put_meta.etag, meta.etag);
    }
}

TEST_F(StorageEngineTest, DeclaredLengthMismatchRejected) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));
    ASSERT_EQ(S3Error::None, engine_.PutObject("bucket", "k", "original"));

    EXPECT_EQ(S3Error::InvalidArgument, engine_.PutObject("bucket", "k", "short", 99));

    std::string data;
    ObjectMeta meta;
    ASSERT_EQ(S3Error::None, engine_.GetObject("bucket", "k", &data, &meta));
    EXPECT_EQ("original", data);
    EXPECT_EQ(1u, engine_.BlobCount());
}

TEST_F(StorageEngineTest, InvalidKeyRejected) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));
    EXPECT_EQ(S3Error::InvalidArgument, engine_.PutObject("bucket", "", "x"));
    EXPECT_EQ(S3Error::InvalidArgument, engine_.PutObject("bucket", std::string(1025, 'k'), "x"));
    EXPECT_EQ(S3Error::None, engine_.PutObject("bucket", std::string(1024, 'k'), "x"));
    EXPECT_EQ(1u, engine_.BlobCount());
}

TEST_F(StorageEngineTest, DeleteOfInvalidKeySucceeds) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));
    ASSERT_EQ(S3Error::None, engine_.PutObject("bucket", "kept", "v"));

    EXPECT_EQ(S3Error::None, engine_.DeleteObject("bucket", ""));
    EXPECT_EQ(S3Error::None, engine_.DeleteObject("bucket", std::string(1025, 'k')));
    EXPECT_EQ((std::vector<std::string>{"kept"}), Keys(engine_, "bucket"));
    EXPECT_EQ(1u, engine_.BlobCount());
}

TEST_F(StorageEngineTest, CancelledPutLeavesNoTrace) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));
    ASSERT_EQ(S3Error::None, engine_.PutObject("bucket", "k", "kept"));

    CancellationToken cancel;
    cancel.Cancel();
    EXPECT_EQ(S3Error::OperationAborted, engine_.PutObject("bucket", "k", "dropped", std::nullopt, nullptr, &cancel));
    EXPECT_EQ(S3Error::OperationAborted, engine_.PutObject("bucket", "new", "dropped", std::nullopt, nullptr, &cancel));

    std::string data;
    ObjectMeta meta;
    ASSERT_EQ(S3Error::None, engine_.GetObject("bucket", "k", &data, &meta));
    EXPECT_EQ("kept", data);
    EXPECT_EQ(S3Error::NoSuchKey, engine_.GetObject("bucket", "new", &data, &meta));
    EXPECT_EQ(1u, engine_.BlobCount());
}

TEST_F(StorageEngineTest, CancellationProbeConsulted) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("bucket"));
    bool gone = true;
    CancellationToken cancel([&gone]() { return gone; });
    EXPECT_EQ(S3Error::OperationAborted, engine_.PutObject("bucket", "k", "v", std::nullopt, nullptr, &cancel));
    gone = false;
    EXPECT_EQ(S3Error::None, engine_.PutObject("bucket", "k", "v", std::nullopt, nullptr, &cancel));
}

TEST(StorageEngineFailureTest, StoreFailureLeavesIndexUnchanged) {
    auto blobs = std::make_unique<FlakyBlobStore>();
    FlakyBlobStore* flaky = blobs.get();
    StorageEngine engine(std::move(blobs));

    ASSERT_EQ(S3Error::None, engine.CreateBucket("bucket"));
    ASSERT_EQ(S3Error::None, engine.PutObject("bucket", "k", "v1"));

    flaky->fail_next_store = true;
    EXPECT_EQ(S3Error::InternalStorageFailure, engine.PutObject("bucket", "k", "v2"));
    flaky->fail_next_store = true;
    EXPECT_EQ(S3Error::InternalStorageFailure, engine.PutObject("bucket", "fresh", "v"));

    std::string data;
    ObjectMeta meta;
    ASSERT_EQ(S3Error::None, engine.GetObject("bucket", "k", &data, &meta));
    EXPECT_EQ("v1", data);
    EXPECT_EQ((std::vector<std::string>{"k"}), Keys(engine, "bucket"));
    EXPECT_EQ(1u, engine.BlobCount());
}

TEST(StorageEngineFailureTest, PayloadAboveBlobLimitRejected) {
    auto blobs = std::make_unique<FlakyBlobStore>();
    blobs->max_blob_size = 8;
    StorageEngine engine(std::move(blobs));

    ASSERT_EQ(S3Error::None, engine.CreateBucket("bucket"));
    ASSERT_EQ(S3Error::None, engine.PutObject("bucket", "k", "12345678"));
    EXPECT_EQ(S3Error::EntityTooLarge, engine.PutObject("bucket", "k", "123456789"));

    std::string data;
    ObjectMeta meta;
    ASSERT_EQ(S3Error::None, engine.GetObject("bucket", "k", &data, &meta));
    EXPECT_EQ("12345678", data);
    EXPECT_EQ(1u, engine.BlobCount());
}

TEST(StorageEngineFailureTest, NullBlobStoreRejected) {
    EXPECT_THROW(StorageEngine{std::unique_ptr<BlobStore>()}, std::invalid_argument);
}

TEST_F(StorageEngineTest, DeleteBucketLifecycle) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("pair"));
    ASSERT_EQ(S3Error::None, engine_.PutObject("pair", "a", "1"));
    ASSERT_EQ(S3Error::None, engine_.PutObject("pair", "b", "2"));

    EXPECT_EQ(S3Error::BucketNotEmpty, engine_.DeleteBucket("pair"));
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), Keys(engine_, "pair"));

    ASSERT_EQ(S3Error::None, engine_.DeleteObject("pair", "a"));
    EXPECT_EQ(S3Error::BucketNotEmpty, engine_.DeleteBucket("pair"));
    ASSERT_EQ(S3Error::None, engine_.DeleteObject("pair", "b"));
    EXPECT_EQ(S3Error::None, engine_.DeleteBucket("pair"));
    EXPECT_EQ(S3Error::NoSuchBucket, engine_.HeadBucket("pair"));
    EXPECT_EQ(0u, engine_.BlobCount());
}

TEST_F(StorageEngineTest, ClientSmokeScenario) {
    const std::string body = "Hello World from Python";

    ASSERT_EQ(S3Error::None, engine_.CreateBucket("mybucket"));
    ASSERT_EQ(S3Error::None, engine_.PutObject("mybucket", "hello.txt", body, body.size()));

    std::string data;
    ObjectMeta meta;
    ASSERT_EQ(S3Error::None, engine_.GetObject("mybucket", "hello.txt", &data, &meta));
    EXPECT_EQ(body, data);
    EXPECT_EQ(body.size(), meta.size);

    EXPECT_EQ((std::vector<std::string>{"hello.txt"}), Keys(engine_, "mybucket"));
    ASSERT_EQ(S3Error::None, engine_.DeleteObject("mybucket", "hello.txt"));
    EXPECT_TRUE(Keys(engine_, "mybucket").empty());
    EXPECT_EQ(S3Error::None, engine_.DeleteBucket("mybucket"));
}

TEST_F(StorageEngineTest, ListDeleteEachTeardown) {
    ASSERT_EQ(S3Error::None, engine_.CreateBucket("teardown"));
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(S3Error::None, engine_.PutObject("teardown", "file-" + std::to_string(i), "payload"));
    }

    std::vector<ObjectSummary> objects;
    ASSERT_EQ(S3Error::None, engine_.ListObjects("teardown", &objects));
    for (const auto& o : objects) {
        std::string data;
        ObjectMeta meta;
        ASSERT_EQ(S3Error::None, engine_.GetObject("teardown", o.key, &data, &meta));
        EXPECT_EQ(o.meta.size, data.size());
    }
    for (const auto& o : objects) {
        ASSERT_EQ(S3Error::None, engine_.DeleteObject("teardown", o.key));
    }
    EXPECT_EQ(S3Error::None, engine_.DeleteBucket("teardown"));
}
