#ifndef S3_ERROR_HPP
#define S3_ERROR_HPP

#include <string>

// Closed set of outcomes returned by every storage operation.
// Engine calls return S3Error::None on success; anything else is a typed,
// recoverable failure that callers translate to their own transport.
enum class S3Error {
    None,

    // Storage core
    BucketAlreadyExists,
    NoSuchBucket,
    NoSuchKey,
    BucketNotEmpty,
    InvalidArgument,
    InternalStorageFailure,
    OperationAborted,

    // Request layer
    InvalidBucketName,
    AccessDenied,
    SignatureDoesNotMatch,
    MissingSecurityHeader,
    InvalidRequest,
    MethodNotAllowed,
    EntityTooLarge
};

// Wire code as it appears in <Code> of an S3 error document.
const char* ErrorCode(S3Error error);

// Default human-readable message for the <Message> element.
const char* ErrorMessage(S3Error error);

int HttpStatus(S3Error error);

// Reverse of ErrorCode(). Unknown codes map to InternalStorageFailure.
S3Error ErrorFromCode(const std::string& code);

#endif // S3_ERROR_HPP
