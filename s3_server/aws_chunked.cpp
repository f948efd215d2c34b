#include "aws_chunked.hpp"
#include "logger.hpp"

namespace {

const std::string kCrlf = "\r\n";

// Refuse chunk headers longer than this; a real one is ~90 bytes.
constexpr size_t kMaxChunkHeader = 4096;

} // namespace

bool IsAwsChunked(const std::string& content_sha256, const std::string& content_encoding) {
    if (content_sha256.compare(0, 10, "STREAMING-") == 0) {
        return true;
    }
    return content_encoding.find("aws-chunked") != std::string::npos;
}

bool AwsChunkedDecoder::ParseChunkSize(const std::string& header_line, size_t* size) {
    std::string hex = header_line.substr(0, header_line.find(';'));
    while (!hex.empty() && (hex.back() == ' ' || hex.back() == '\t')) {
        hex.pop_back();
    }
    if (hex.empty() || hex.size() > 16) {
        return false;
    }

    size_t value = 0;
    for (char c : hex) {
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            return false;
        }
        value = value * 16 + digit;
    }
    *size = value;
    return true;
}

S3Error AwsChunkedDecoder::Decode(const std::string& body, std::string* out) {
    chunk_count_ = 0;
    out->clear();

    size_t pos = 0;
    while (true) {
        size_t eol = body.find(kCrlf, pos);
        if (eol == std::string::npos || eol - pos > kMaxChunkHeader) {
            Logger::Warn("aws-chunked body ended inside a chunk header", "AwsChunked");
            return S3Error::InvalidRequest;
        }

        size_t chunk_size = 0;
        if (!ParseChunkSize(body.substr(pos, eol - pos), &chunk_size)) {
            Logger::Warn("Invalid aws-chunked size line at offset " + std::to_string(pos), "AwsChunked");
            return S3Error::InvalidRequest;
        }
        pos = eol + kCrlf.size();

        if (chunk_size == 0) {
            // Trailers (x-amz-checksum-*) follow; nothing in them is payload.
            return S3Error::None;
        }

        if (chunk_size > body.size() - pos || body.size() - pos - chunk_size < kCrlf.size() ||
            body.compare(pos + chunk_size, kCrlf.size(), kCrlf) != 0) {
            Logger::Warn("Truncated aws-chunked data chunk of " + std::to_string(chunk_size) + " bytes", "AwsChunked");
            return S3Error::InvalidRequest;
        }

        out->append(body, pos, chunk_size);
        pos += chunk_size + kCrlf.size();
        ++chunk_count_;
    }
}
