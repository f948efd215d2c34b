#ifndef S3_CLIENT_HPP
#define S3_CLIENT_HPP

#include <string>
#include <vector>
#include "s3_error.hpp"
#include "sigv4.hpp"

// Minimal path-style S3 client over libcurl. Every request is SigV4 signed
// with a hashed payload.
class S3Client {
public:
    // endpoint is scheme://host[:port], e.g. "http://localhost:8080".
    S3Client(const std::string& endpoint, const SigV4Credentials& creds, bool verify_tls = true);
    ~S3Client();

    S3Client(const S3Client&) = delete;
    S3Client& operator=(const S3Client&) = delete;

    S3Error CreateBucket(const std::string& bucket);
    S3Error DeleteBucket(const std::string& bucket);
    S3Error PutObject(const std::string& bucket, const std::string& key, const std::string& body);
    S3Error GetObject(const std::string& bucket, const std::string& key, std::string* body);
    S3Error ListObjects(const std::string& bucket, std::vector<std::string>* keys);
    S3Error DeleteObject(const std::string& bucket, const std::string& key);

    // <Message> of the last error response, or the transport error text.
    const std::string& last_message() const { return last_message_; }

private:
    std::string endpoint_;
    std::string host_;
    SigV4Credentials creds_;
    bool verify_tls_;
    std::string last_message_;

    // Sends one signed request. Returns None for 2xx, the parsed <Code> for
    // S3 error documents and InternalStorageFailure for transport failures.
    S3Error Perform(const std::string& method, const std::string& path, const std::string& body,
                    std::string* response_body);
};

#endif // S3_CLIENT_HPP
