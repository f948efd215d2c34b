#ifndef STORAGE_SERVICE_HPP
#define STORAGE_SERVICE_HPP

#include <cstdint>
#include <memory>
#include <grpcpp/grpcpp.h>
#include "s3core.grpc.pb.h"
#include "health.grpc.pb.h"
#include "config.hpp"
#include "s3_error.hpp"
#include "storage_engine.hpp"

// gRPC status for an engine outcome; the message is "<S3 code>: <message>".
grpc::Status ToGrpcStatus(S3Error error);

class ObjectStorageServiceImpl final : public s3core::ObjectStorage::Service {
public:
    ObjectStorageServiceImpl(StorageEngine& engine, uint64_t max_object_size);

    grpc::Status CreateBucket(grpc::ServerContext* context, const s3core::CreateBucketRequest* request,
                              s3core::CreateBucketResponse* response) override;
    grpc::Status DeleteBucket(grpc::ServerContext* context, const s3core::DeleteBucketRequest* request,
                              s3core::DeleteBucketResponse* response) override;
    grpc::Status ListBuckets(grpc::ServerContext* context, const s3core::ListBucketsRequest* request,
                             s3core::ListBucketsResponse* response) override;
    grpc::Status PutObject(grpc::ServerContext* context, grpc::ServerReader<s3core::PutObjectRequest>* reader,
                           s3core::PutObjectResponse* response) override;
    grpc::Status GetObject(grpc::ServerContext* context, const s3core::GetObjectRequest* request,
                           grpc::ServerWriter<s3core::GetObjectResponse>* writer) override;
    grpc::Status ListObjects(grpc::ServerContext* context, const s3core::ListObjectsRequest* request,
                             s3core::ListObjectsResponse* response) override;
    grpc::Status DeleteObject(grpc::ServerContext* context, const s3core::DeleteObjectRequest* request,
                              s3core::DeleteObjectResponse* response) override;

private:
    StorageEngine& engine_;
    uint64_t max_object_size_;
};

class HealthServiceImpl final : public grpc::health::v1::Health::Service {
public:
    grpc::Status Check(grpc::ServerContext* context, const grpc::health::v1::HealthCheckRequest* request,
                       grpc::health::v1::HealthCheckResponse* response) override;
    grpc::Status Watch(grpc::ServerContext* context, const grpc::health::v1::HealthCheckRequest* request,
                       grpc::ServerWriter<grpc::health::v1::HealthCheckResponse>* writer) override;
};

// Builds credentials from config.tls_cert_dir (ca.crt, server.crt,
// server.key, client certificates required) or insecure ones if it is empty.
// Throws std::runtime_error if a certificate file cannot be read.
std::shared_ptr<grpc::ServerCredentials> BuildServerCredentials(const Config::ServerConfig& config);

// Serves the storage and health services on config.grpc_address until the
// process exits.
void RunGrpcServer(StorageEngine& engine, const Config::ServerConfig& config);

#endif // STORAGE_SERVICE_HPP
