#ifndef SIGV4_HPP
#define SIGV4_HPP

#include <map>
#include <string>
#include <vector>
#include "s3_error.hpp"

// AWS Signature Version 4 for the "s3" service, header-based auth only.

struct SigV4Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region = "us-east-1";
};

// Fields of "AWS4-HMAC-SHA256 Credential=AK/DATE/REGION/SERVICE/aws4_request,
// SignedHeaders=a;b;c, Signature=hex".
struct AuthorizationHeader {
    std::string access_key;
    std::string date;    // YYYYMMDD
    std::string region;
    std::string service;
    std::vector<std::string> signed_headers;
    std::string signature;
};

// A request as seen by the verifier. Header names must be lower case; path
// and query values are the decoded forms.
struct SigV4Request {
    std::string method;
    std::string path;
    std::multimap<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
};

// RFC 3986 percent-encoding as AWS specifies it. '/' is kept when
// encode_slash is false (for URI paths).
std::string UriEncode(const std::string& value, bool encode_slash);

std::string CanonicalQueryString(const std::multimap<std::string, std::string>& query);

bool ParseAuthorization(const std::string& header, AuthorizationHeader* out);

std::string CanonicalRequest(const std::string& method,
                             const std::string& path,
                             const std::multimap<std::string, std::string>& query,
                             const std::map<std::string, std::string>& headers,
                             const std::vector<std::string>& signed_headers,
                             const std::string& payload_hash);

std::string StringToSign(const std::string& amz_date, const std::string& scope, const std::string& canonical_request);

std::string DeriveSigningKey(const std::string& secret_key, const std::string& date,
                             const std::string& region, const std::string& service);

// Checks the Authorization header against creds. The credential scope must
// name creds.region and the "s3" service. Returns None,
// MissingSecurityHeader, AccessDenied or SignatureDoesNotMatch.
S3Error VerifyRequest(const SigV4Request& request, const SigV4Credentials& creds);

// Builds the Authorization header value for an outgoing request. headers
// (lower-case names) are all signed and must include host, x-amz-date and
// x-amz-content-sha256.
std::string SignRequest(const std::string& method,
                        const std::string& path,
                        const std::multimap<std::string, std::string>& query,
                        const std::map<std::string, std::string>& headers,
                        const std::string& payload_hash,
                        const std::string& amz_date,
                        const SigV4Credentials& creds);

#endif // SIGV4_HPP
