#ifndef AWS_CHUNKED_HPP
#define AWS_CHUNKED_HPP

#include <string>
#include "s3_error.hpp"

// Decoder for the aws-chunked payload framing SDKs use for streaming uploads:
//
//   <hex-size>[;chunk-signature=<sig>]\r\n<data>\r\n ... 0[;...]\r\n[trailers]\r\n
//
// Chunk signatures are parsed past but not verified.

// True if the request headers announce an aws-chunked body.
bool IsAwsChunked(const std::string& content_sha256, const std::string& content_encoding);

class AwsChunkedDecoder {
public:
    // Decodes a complete body into out. Returns InvalidRequest on bad framing
    // and leaves out unspecified.
    S3Error Decode(const std::string& body, std::string* out);

    // Number of data chunks (excluding the terminating zero chunk) seen by the
    // last Decode().
    size_t chunk_count() const { return chunk_count_; }

private:
    size_t chunk_count_ = 0;

    static bool ParseChunkSize(const std::string& header_line, size_t* size);
};

#endif // AWS_CHUNKED_HPP
