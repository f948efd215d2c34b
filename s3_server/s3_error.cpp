#include "s3_error.hpp"

namespace {

struct ErrorInfo {
    S3Error error;
    const char* code;
    const char* message;
    int http_status;
};

const ErrorInfo kErrors[] = {
    {S3Error::None, "OK", "OK", 200},
    {S3Error::BucketAlreadyExists, "BucketAlreadyExists",
     "The requested bucket name is not available.", 409},
    {S3Error::NoSuchBucket, "NoSuchBucket", "The specified bucket does not exist.", 404},
    {S3Error::NoSuchKey, "NoSuchKey", "The specified key does not exist.", 404},
    {S3Error::BucketNotEmpty, "BucketNotEmpty",
     "The bucket you tried to delete is not empty.", 409},
    {S3Error::InvalidArgument, "InvalidArgument", "Invalid Argument", 400},
    {S3Error::InternalStorageFailure, "InternalError",
     "We encountered an internal error. Please try again.", 500},
    {S3Error::OperationAborted, "OperationAborted",
     "The operation was aborted before it completed.", 409},
    {S3Error::InvalidBucketName, "InvalidBucketName",
     "The specified bucket is not valid.", 400},
    {S3Error::AccessDenied, "AccessDenied", "Access Denied", 403},
    {S3Error::SignatureDoesNotMatch, "SignatureDoesNotMatch",
     "The request signature we calculated does not match the signature you provided.", 403},
    {S3Error::MissingSecurityHeader, "MissingSecurityHeader",
     "Your request is missing a required authentication header.", 403},
    {S3Error::InvalidRequest, "InvalidRequest", "Invalid Request", 400},
    {S3Error::MethodNotAllowed, "MethodNotAllowed",
     "The specified method is not allowed against this resource.", 405},
    {S3Error::EntityTooLarge, "EntityTooLarge",
     "Your proposed upload exceeds the maximum allowed object size.", 400},
};

const ErrorInfo& Lookup(S3Error error) {
    for (const auto& info : kErrors) {
        if (info.error == error) {
            return info;
        }
    }
    return kErrors[static_cast<int>(S3Error::InternalStorageFailure)];
}

} // namespace

const char* ErrorCode(S3Error error) {
    return Lookup(error).code;
}

const char* ErrorMessage(S3Error error) {
    return Lookup(error).message;
}

int HttpStatus(S3Error error) {
    return Lookup(error).http_status;
}

S3Error ErrorFromCode(const std::string& code) {
    for (const auto& info : kErrors) {
        if (code == info.code) {
            return info.error;
        }
    }
    return S3Error::InternalStorageFailure;
}
