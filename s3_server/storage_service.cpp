#include "storage_service.hpp"
#include "logger.hpp"
#include <chrono>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <thread>

using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;

namespace {

const char* kComponent = "gRPC";
constexpr size_t kChunkSize = 64 * 1024;

int64_t ToMillis(std::chrono::system_clock::time_point when) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
}

void FillObjectInfo(const std::string& key, const ObjectMeta& meta, s3core::ObjectInfo* info) {
    info->set_key(key);
    info->set_size(meta.size);
    info->set_etag(meta.etag);
    info->set_last_modified_ms(ToMillis(meta.last_modified));
}

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace

Status ToGrpcStatus(S3Error error) {
    StatusCode code;
    switch (error) {
        case S3Error::None: return Status::OK;
        case S3Error::BucketAlreadyExists: code = StatusCode::ALREADY_EXISTS; break;
        case S3Error::NoSuchBucket:
        case S3Error::NoSuchKey: code = StatusCode::NOT_FOUND; break;
        case S3Error::BucketNotEmpty: code = StatusCode::FAILED_PRECONDITION; break;
        case S3Error::InvalidArgument:
        case S3Error::InvalidBucketName:
        case S3Error::InvalidRequest: code = StatusCode::INVALID_ARGUMENT; break;
        case S3Error::OperationAborted: code = StatusCode::ABORTED; break;
        case S3Error::EntityTooLarge: code = StatusCode::RESOURCE_EXHAUSTED; break;
        case S3Error::AccessDenied:
        case S3Error::SignatureDoesNotMatch:
        case S3Error::MissingSecurityHeader: code = StatusCode::PERMISSION_DENIED; break;
        case S3Error::MethodNotAllowed: code = StatusCode::UNIMPLEMENTED; break;
        default: code = StatusCode::INTERNAL; break;
    }
    return Status(code, std::string(ErrorCode(error)) + ": " + ErrorMessage(error));
}

ObjectStorageServiceImpl::ObjectStorageServiceImpl(StorageEngine& engine, uint64_t max_object_size)
    : engine_(engine), max_object_size_(max_object_size) {}

Status ObjectStorageServiceImpl::CreateBucket(ServerContext* context, const s3core::CreateBucketRequest* request,
                                              s3core::CreateBucketResponse* response) {
    return ToGrpcStatus(engine_.CreateBucket(request->bucket()));
}

Status ObjectStorageServiceImpl::DeleteBucket(ServerContext* context, const s3core::DeleteBucketRequest* request,
                                              s3core::DeleteBucketResponse* response) {
    return ToGrpcStatus(engine_.DeleteBucket(request->bucket()));
}

Status ObjectStorageServiceImpl::ListBuckets(ServerContext* context, const s3core::ListBucketsRequest* request,
                                             s3core::ListBucketsResponse* response) {
    for (const auto& bucket : engine_.ListBuckets()) {
        auto* info = response->add_buckets();
        info->set_name(bucket.name);
        info->set_created_ms(ToMillis(bucket.created));
    }
    return Status::OK;
}

Status ObjectStorageServiceImpl::PutObject(ServerContext* context,
                                           grpc::ServerReader<s3core::PutObjectRequest>* reader,
                                           s3core::PutObjectResponse* response) {
    s3core::PutObjectRequest request;
    s3core::PutObjectMetadata metadata;
    bool have_metadata = false;
    std::string data;

    while (reader->Read(&request)) {
        if (request.has_metadata()) {
            if (have_metadata) {
                return Status(StatusCode::INVALID_ARGUMENT, "InvalidRequest: metadata sent twice");
            }
            metadata = request.metadata();
            have_metadata = true;
        } else if (request.request_case() == s3core::PutObjectRequest::kChunk) {
            if (!have_metadata) {
                return Status(StatusCode::INVALID_ARGUMENT, "InvalidRequest: chunk received before metadata");
            }
            if (data.size() + request.chunk().size() > max_object_size_) {
                return ToGrpcStatus(S3Error::EntityTooLarge);
            }
            data.append(request.chunk());
        }
    }

    if (!have_metadata) {
        return Status(StatusCode::INVALID_ARGUMENT, "InvalidRequest: upload carried no metadata");
    }

    std::optional<size_t> declared_length;
    if (metadata.has_declared_length()) {
        declared_length = static_cast<size_t>(metadata.declared_length());
    }

    // A caller that hangs up between the last chunk and the index update
    // must not leave the object half-written.
    CancellationToken cancel([context]() { return context->IsCancelled(); });

    ObjectMeta meta;
    S3Error err = engine_.PutObject(metadata.bucket(), metadata.key(), data, declared_length, &meta, &cancel);
    if (err != S3Error::None) {
        return ToGrpcStatus(err);
    }
    FillObjectInfo(metadata.key(), meta, response->mutable_object());
    return Status::OK;
}

Status ObjectStorageServiceImpl::GetObject(ServerContext* context, const s3core::GetObjectRequest* request,
                                           grpc::ServerWriter<s3core::GetObjectResponse>* writer) {
    std::string data;
    ObjectMeta meta;
    S3Error err = engine_.GetObject(request->bucket(), request->key(), &data, &meta);
    if (err != S3Error::None) {
        return ToGrpcStatus(err);
    }

    s3core::GetObjectResponse header;
    FillObjectInfo(request->key(), meta, header.mutable_object());
    if (!writer->Write(header)) {
        return Status(StatusCode::CANCELLED, "OperationAborted: client went away");
    }

    for (size_t offset = 0; offset < data.size(); offset += kChunkSize) {
        s3core::GetObjectResponse chunk;
        chunk.set_chunk(data.substr(offset, kChunkSize));
        if (!writer->Write(chunk)) {
            return Status(StatusCode::CANCELLED, "OperationAborted: client went away");
        }
    }
    return Status::OK;
}

Status ObjectStorageServiceImpl::ListObjects(ServerContext* context, const s3core::ListObjectsRequest* request,
                                             s3core::ListObjectsResponse* response) {
    std::vector<ObjectSummary> objects;
    S3Error err = engine_.ListObjects(request->bucket(), &objects);
    if (err != S3Error::None) {
        return ToGrpcStatus(err);
    }
    for (const auto& object : objects) {
        FillObjectInfo(object.key, object.meta, response->add_objects());
    }
    return Status::OK;
}

Status ObjectStorageServiceImpl::DeleteObject(ServerContext* context, const s3core::DeleteObjectRequest* request,
                                              s3core::DeleteObjectResponse* response) {
    return ToGrpcStatus(engine_.DeleteObject(request->bucket(), request->key()));
}

Status HealthServiceImpl::Check(ServerContext* context, const grpc::health::v1::HealthCheckRequest* request,
                                grpc::health::v1::HealthCheckResponse* response) {
    response->set_status(grpc::health::v1::HealthCheckResponse::SERVING);
    return Status::OK;
}

Status HealthServiceImpl::Watch(ServerContext* context, const grpc::health::v1::HealthCheckRequest* request,
                                grpc::ServerWriter<grpc::health::v1::HealthCheckResponse>* writer) {
    grpc::health::v1::HealthCheckResponse response;
    response.set_status(grpc::health::v1::HealthCheckResponse::SERVING);
    if (!writer->Write(response)) {
        return Status::OK;
    }
    while (!context->IsCancelled()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    return Status::OK;
}

std::shared_ptr<grpc::ServerCredentials> BuildServerCredentials(const Config::ServerConfig& config) {
    if (config.tls_cert_dir.empty()) {
        Logger::Warn("No tls.cert_dir configured; gRPC listener is plaintext", kComponent);
        return grpc::InsecureServerCredentials();
    }

    grpc::SslServerCredentialsOptions ssl_opts;
    ssl_opts.pem_root_certs = ReadFile(config.tls_cert_dir + "/ca.crt");
    grpc::SslServerCredentialsOptions::PemKeyCertPair pkcp = {
        ReadFile(config.tls_cert_dir + "/server.key"),
        ReadFile(config.tls_cert_dir + "/server.crt")
    };
    ssl_opts.pem_key_cert_pairs.push_back(pkcp);
    ssl_opts.client_certificate_request = GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY;
    return grpc::SslServerCredentials(ssl_opts);
}

void RunGrpcServer(StorageEngine& engine, const Config::ServerConfig& config) {
    ObjectStorageServiceImpl storage_service(engine, config.max_object_size);
    HealthServiceImpl health_service;

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.grpc_address, BuildServerCredentials(config));
    builder.SetMaxReceiveMessageSize(-1);
    builder.RegisterService(&storage_service);
    builder.RegisterService(&health_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (server == nullptr) {
        throw std::runtime_error("Failed to build or start the gRPC server on " + config.grpc_address);
    }
    Logger::Info("gRPC server listening on " + config.grpc_address, kComponent);
    server->Wait();
}
