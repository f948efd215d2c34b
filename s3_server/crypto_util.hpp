#ifndef CRYPTO_UTIL_HPP
#define CRYPTO_UTIL_HPP

#include <string>
#include <cstddef>

// Thin wrappers over OpenSSL digests used for ETags and request signing.

std::string HexEncode(const unsigned char* data, size_t len);

// Raw 32-byte HMAC-SHA256 of msg under key.
std::string HmacSha256(const std::string& key, const std::string& msg);

// Lowercase hex SHA-256 of data.
std::string Sha256Hex(const std::string& data);

// Lowercase hex MD5 of data. This is the object ETag.
std::string Md5Hex(const std::string& data);

// Compares without early exit.
bool ConstantTimeEquals(const std::string& a, const std::string& b);

#endif // CRYPTO_UTIL_HPP
