#include "sigv4.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace {

const char* kAlgorithm = "AWS4-HMAC-SHA256";

std::string Trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

// Trims and collapses inner runs of spaces, as canonical header values require.
std::string CanonicalHeaderValue(const std::string& value) {
    std::string trimmed = Trim(value);
    std::string out;
    out.reserve(trimmed.size());
    bool in_space = false;
    for (char c : trimmed) {
        if (c == ' ' || c == '\t') {
            if (!in_space) {
                out.push_back(' ');
            }
            in_space = true;
        } else {
            out.push_back(c);
            in_space = false;
        }
    }
    return out;
}

std::vector<std::string> Split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        parts.push_back(item);
    }
    return parts;
}

std::string Join(const std::vector<std::string>& parts, char delim) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.push_back(delim);
        }
        out += parts[i];
    }
    return out;
}

std::string Scope(const std::string& date, const std::string& region, const std::string& service) {
    return date + "/" + region + "/" + service + "/aws4_request";
}

} // namespace

std::string UriEncode(const std::string& value, bool encode_slash) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string CanonicalQueryString(const std::multimap<std::string, std::string>& query) {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(query.size());
    for (const auto& param : query) {
        encoded.emplace_back(UriEncode(param.first, true), UriEncode(param.second, true));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string out;
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (i > 0) {
            out.push_back('&');
        }
        out += encoded[i].first + "=" + encoded[i].second;
    }
    return out;
}

bool ParseAuthorization(const std::string& header, AuthorizationHeader* out) {
    const std::string prefix = std::string(kAlgorithm) + " ";
    if (header.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    AuthorizationHeader parsed;
    bool have_credential = false;
    bool have_signed = false;
    bool have_signature = false;

    for (const auto& raw : Split(header.substr(prefix.size()), ',')) {
        std::string field = Trim(raw);
        size_t eq = field.find('=');
        if (eq == std::string::npos) {
            return false;
        }
        std::string name = field.substr(0, eq);
        std::string value = field.substr(eq + 1);

        if (name == "Credential") {
            std::vector<std::string> parts = Split(value, '/');
            if (parts.size() != 5 || parts[4] != "aws4_request") {
                return false;
            }
            parsed.access_key = parts[0];
            parsed.date = parts[1];
            parsed.region = parts[2];
            parsed.service = parts[3];
            have_credential = true;
        } else if (name == "SignedHeaders") {
            parsed.signed_headers = Split(value, ';');
            have_signed = !parsed.signed_headers.empty();
        } else if (name == "Signature") {
            parsed.signature = value;
            have_signature = !value.empty();
        }
    }

    if (!have_credential || !have_signed || !have_signature) {
        return false;
    }
    *out = std::move(parsed);
    return true;
}

std::string CanonicalRequest(const std::string& method,
                             const std::string& path,
                             const std::multimap<std::string, std::string>& query,
                             const std::map<std::string, std::string>& headers,
                             const std::vector<std::string>& signed_headers,
                             const std::string& payload_hash) {
    std::stringstream canonical_req;
    canonical_req << method << "\n"
                  << UriEncode(path.empty() ? "/" : path, false) << "\n"
                  << CanonicalQueryString(query) << "\n";

    for (const auto& name : signed_headers) {
        auto it = headers.find(name);
        std::string value = it == headers.end() ? "" : it->second;
        canonical_req << name << ":" << CanonicalHeaderValue(value) << "\n";
    }
    canonical_req << "\n"
                  << Join(signed_headers, ';') << "\n"
                  << payload_hash;
    return canonical_req.str();
}

std::string StringToSign(const std::string& amz_date, const std::string& scope, const std::string& canonical_request) {
    std::stringstream string_to_sign;
    string_to_sign << kAlgorithm << "\n"
                   << amz_date << "\n"
                   << scope << "\n"
                   << Sha256Hex(canonical_request);
    return string_to_sign.str();
}

std::string DeriveSigningKey(const std::string& secret_key, const std::string& date,
                             const std::string& region, const std::string& service) {
    std::string kDate = HmacSha256("AWS4" + secret_key, date);
    std::string kRegion = HmacSha256(kDate, region);
    std::string kService = HmacSha256(kRegion, service);
    return HmacSha256(kService, "aws4_request");
}

S3Error VerifyRequest(const SigV4Request& request, const SigV4Credentials& creds) {
    auto auth_it = request.headers.find("authorization");
    if (auth_it == request.headers.end()) {
        return S3Error::MissingSecurityHeader;
    }

    AuthorizationHeader auth;
    if (!ParseAuthorization(auth_it->second, &auth)) {
        Logger::Warn("Malformed Authorization header", "SigV4");
        return S3Error::MissingSecurityHeader;
    }

    if (auth.access_key != creds.access_key) {
        Logger::Warn("Access key mismatch for " + auth.access_key, "SigV4");
        return S3Error::AccessDenied;
    }

    if (auth.region != creds.region || auth.service != "s3") {
        Logger::Warn("Credential scope " + auth.region + "/" + auth.service + " does not match " + creds.region + "/s3",
                     "SigV4");
        return S3Error::SignatureDoesNotMatch;
    }

    auto date_it = request.headers.find("x-amz-date");
    if (date_it == request.headers.end() || date_it->second.empty()) {
        Logger::Warn("Missing x-amz-date header", "SigV4");
        return S3Error::MissingSecurityHeader;
    }

    std::string payload_hash;
    auto hash_it = request.headers.find("x-amz-content-sha256");
    if (hash_it != request.headers.end() && !hash_it->second.empty()) {
        payload_hash = hash_it->second;
    } else {
        payload_hash = Sha256Hex(request.body);
    }

    std::string canonical = CanonicalRequest(request.method, request.path, request.query, request.headers,
                                             auth.signed_headers, payload_hash);
    std::string scope = Scope(auth.date, auth.region, auth.service);
    std::string to_sign = StringToSign(date_it->second, scope, canonical);
    std::string key = DeriveSigningKey(creds.secret_key, auth.date, auth.region, auth.service);
    std::string raw = HmacSha256(key, to_sign);
    std::string expected = HexEncode(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());

    Logger::Debug("CanonicalRequest:\n" + canonical, "SigV4");

    if (!ConstantTimeEquals(expected, auth.signature)) {
        Logger::Warn("Signature mismatch for " + request.method + " " + request.path, "SigV4");
        return S3Error::SignatureDoesNotMatch;
    }
    return S3Error::None;
}

std::string SignRequest(const std::string& method,
                        const std::string& path,
                        const std::multimap<std::string, std::string>& query,
                        const std::map<std::string, std::string>& headers,
                        const std::string& payload_hash,
                        const std::string& amz_date,
                        const SigV4Credentials& creds) {
    const std::string service = "s3";
    std::string date_ymd = amz_date.substr(0, 8);

    std::vector<std::string> signed_headers;
    for (const auto& header : headers) {
        signed_headers.push_back(header.first);
    }

    std::string canonical = CanonicalRequest(method, path, query, headers, signed_headers, payload_hash);
    std::string scope = Scope(date_ymd, creds.region, service);
    std::string to_sign = StringToSign(amz_date, scope, canonical);
    std::string key = DeriveSigningKey(creds.secret_key, date_ymd, creds.region, service);
    std::string raw = HmacSha256(key, to_sign);
    std::string signature = HexEncode(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());

    std::stringstream auth_header;
    auth_header << kAlgorithm << " Credential=" << creds.access_key << "/" << scope
                << ", SignedHeaders=" << Join(signed_headers, ';') << ", Signature=" << signature;
    return auth_header.str();
}
