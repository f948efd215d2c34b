#include "http_gateway.hpp"
#include <httplib.h>
#include "aws_chunked.hpp"
#include "logger.hpp"
#include "s3_xml.hpp"
#include "sigv4.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <optional>
#include <utility>

namespace {

const char* kComponent = "HTTP";
const char* kXmlType = "application/xml";

// Room for aws-chunked framing (~90 bytes per chunk, chunks of at least 8 KiB)
// on top of max_object_size in httplib's body limit.
uint64_t PayloadLimit(uint64_t max_object_size) {
    return max_object_size + max_object_size / 64 + 8192;
}

// Bucket-only and bucket/key paths. Keys may contain '/'.
const char* kBucketRoute = R"(/([^/]+)/?)";
const char* kObjectRoute = R"(/([^/]+)/(.+))";

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool ParseLength(const std::string& value, size_t* out) {
    if (value.empty() || value.size() > 19) {
        return false;
    }
    size_t n = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
        n = n * 10 + (c - '0');
    }
    *out = n;
    return true;
}

} // namespace

S3Gateway::S3Gateway(StorageEngine& engine, const Config::ServerConfig& config)
    : engine_(engine), config_(config) {}

void S3Gateway::Register(httplib::Server& svr) {
    // httplib refuses larger bodies with a bare 413 before a handler runs;
    // the error handler turns that into the S3 error document.
    svr.set_payload_max_length(static_cast<size_t>(PayloadLimit(config_.max_object_size)));
    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (res.status == 413) {
            SendError(req, res, S3Error::EntityTooLarge);
        }
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        Logger::Info(req.method + " " + req.path + " -> " + std::to_string(res.status), kComponent);
    });

    svr.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        Serve(req, res, [this](const httplib::Request& r, httplib::Response& s) { ListBuckets(r, s); });
    });

    svr.Put(kBucketRoute, [this](const httplib::Request& req, httplib::Response& res) {
        Serve(req, res, [this](const httplib::Request& r, httplib::Response& s) { CreateBucket(r, s); });
    });
    // Also answers HEAD, which httplib routes to GET handlers.
    svr.Get(kBucketRoute, [this](const httplib::Request& req, httplib::Response& res) {
        Serve(req, res, [this](const httplib::Request& r, httplib::Response& s) { ListObjects(r, s); });
    });
    svr.Delete(kBucketRoute, [this](const httplib::Request& req, httplib::Response& res) {
        Serve(req, res, [this](const httplib::Request& r, httplib::Response& s) { DeleteBucket(r, s); });
    });

    svr.Put(kObjectRoute, [this](const httplib::Request& req, httplib::Response& res) {
        Serve(req, res, [this](const httplib::Request& r, httplib::Response& s) { PutObject(r, s); });
    });
    svr.Get(kObjectRoute, [this](const httplib::Request& req, httplib::Response& res) {
        Serve(req, res, [this](const httplib::Request& r, httplib::Response& s) { GetObject(r, s); });
    });
    svr.Delete(kObjectRoute, [this](const httplib::Request& req, httplib::Response& res) {
        Serve(req, res, [this](const httplib::Request& r, httplib::Response& s) { DeleteObject(r, s); });
    });

    auto not_allowed = [](const httplib::Request& req, httplib::Response& res) {
        SendError(req, res, S3Error::MethodNotAllowed);
    };
    svr.Post(".*", not_allowed);
    svr.Patch(".*", not_allowed);
}

void S3Gateway::Serve(const httplib::Request& req, httplib::Response& res, const Handler& handler) {
    try {
        S3Error auth = Authenticate(req);
        if (auth != S3Error::None) {
            SendError(req, res, auth);
            return;
        }
        handler(req, res);
    } catch (const std::exception& e) {
        Logger::Error("Unhandled exception for " + req.method + " " + req.path + ": " + e.what(), kComponent);
        SendError(req, res, S3Error::InternalStorageFailure);
    }
}

S3Error S3Gateway::Authenticate(const httplib::Request& req) {
    if (!config_.auth_enabled) {
        return S3Error::None;
    }

    SigV4Request signed_req;
    signed_req.method = req.method;
    signed_req.path = req.path;
    for (const auto& param : req.params) {
        signed_req.query.emplace(param.first, param.second);
    }
    for (const auto& header : req.headers) {
        signed_req.headers[Lower(header.first)] = header.second;
    }
    signed_req.body = req.body;

    SigV4Credentials creds;
    creds.access_key = config_.access_key;
    creds.secret_key = config_.secret_key;
    creds.region = config_.region;
    return VerifyRequest(signed_req, creds);
}

void S3Gateway::SendError(const httplib::Request& req, httplib::Response& res, S3Error error,
                          const std::string& message) {
    res.status = HttpStatus(error);
    if (req.method != "HEAD") {
        res.set_content(ErrorXml(error, req.path, message), kXmlType);
    }
}

void S3Gateway::ListBuckets(const httplib::Request&, httplib::Response& res) {
    std::string owner = config_.access_key.empty() ? "s3core" : config_.access_key;
    res.set_content(ListAllMyBucketsResultXml(owner, engine_.ListBuckets()), kXmlType);
}

void S3Gateway::CreateBucket(const httplib::Request& req, httplib::Response& res) {
    std::string bucket = req.matches[1];
    S3Error err = engine_.CreateBucket(bucket);
    if (err != S3Error::None) {
        SendError(req, res, err);
        return;
    }
    res.set_header("Location", "/" + bucket);
    res.set_content(CreateBucketResultXml(bucket), kXmlType);
}

void S3Gateway::ListObjects(const httplib::Request& req, httplib::Response& res) {
    std::string bucket = req.matches[1];

    if (req.method == "HEAD") {
        S3Error err = engine_.HeadBucket(bucket);
        if (err != S3Error::None) {
            SendError(req, res, err);
        }
        return;
    }

    std::vector<ObjectSummary> objects;
    S3Error err = engine_.ListObjects(bucket, &objects);
    if (err != S3Error::None) {
        SendError(req, res, err);
        return;
    }
    res.set_content(ListBucketResultXml(bucket, objects), kXmlType);
}

void S3Gateway::DeleteBucket(const httplib::Request& req, httplib::Response& res) {
    S3Error err = engine_.DeleteBucket(req.matches[1]);
    if (err != S3Error::None) {
        SendError(req, res, err);
        return;
    }
    res.status = 204;
}

void S3Gateway::PutObject(const httplib::Request& req, httplib::Response& res) {
    std::string bucket = req.matches[1];
    std::string key = req.matches[2];

    std::string decoded;
    const std::string* payload = &req.body;
    std::optional<size_t> declared_length;

    if (IsAwsChunked(req.get_header_value("x-amz-content-sha256"), req.get_header_value("Content-Encoding"))) {
        AwsChunkedDecoder decoder;
        S3Error err = decoder.Decode(req.body, &decoded);
        if (err != S3Error::None) {
            SendError(req, res, err, "Malformed aws-chunked payload");
            return;
        }
        payload = &decoded;
        if (req.has_header("x-amz-decoded-content-length")) {
            size_t n = 0;
            if (!ParseLength(req.get_header_value("x-amz-decoded-content-length"), &n)) {
                SendError(req, res, S3Error::InvalidArgument, "Invalid x-amz-decoded-content-length");
                return;
            }
            declared_length = n;
        }
    } else if (req.has_header("Content-Length")) {
        size_t n = 0;
        if (!ParseLength(req.get_header_value("Content-Length"), &n)) {
            SendError(req, res, S3Error::InvalidArgument, "Invalid Content-Length");
            return;
        }
        declared_length = n;
    }

    if (payload->size() > config_.max_object_size) {
        SendError(req, res, S3Error::EntityTooLarge);
        return;
    }

    ObjectMeta meta;
    S3Error err = engine_.PutObject(bucket, key, *payload, declared_length, &meta);
    if (err != S3Error::None) {
        SendError(req, res, err);
        return;
    }
    res.set_header("ETag", QuoteEtag(meta.etag));
}

void S3Gateway::GetObject(const httplib::Request& req, httplib::Response& res) {
    std::string bucket = req.matches[1];
    std::string key = req.matches[2];

    ObjectMeta meta;
    if (req.method == "HEAD") {
        S3Error err = engine_.HeadObject(bucket, key, &meta);
        if (err != S3Error::None) {
            SendError(req, res, err);
            return;
        }
        res.set_header("ETag", QuoteEtag(meta.etag));
        res.set_header("Last-Modified", FormatHttpDate(meta.last_modified));
        res.set_header("Content-Length", std::to_string(meta.size));
        return;
    }

    std::string data;
    S3Error err = engine_.GetObject(bucket, key, &data, &meta);
    if (err != S3Error::None) {
        SendError(req, res, err);
        return;
    }
    res.set_header("ETag", QuoteEtag(meta.etag));
    res.set_header("Last-Modified", FormatHttpDate(meta.last_modified));
    res.set_content(std::move(data), "application/octet-stream");
}

void S3Gateway::DeleteObject(const httplib::Request& req, httplib::Response& res) {
    S3Error err = engine_.DeleteObject(req.matches[1], req.matches[2]);
    if (err != S3Error::None) {
        SendError(req, res, err);
        return;
    }
    res.status = 204;
}

void RunHTTPServer(StorageEngine& engine, const Config::ServerConfig& config) {
    httplib::Server svr;
    S3Gateway gateway(engine, config);
    gateway.Register(svr);

    Logger::Info("S3 endpoint listening on " + config.http_host + ":" + std::to_string(config.http_port), kComponent);
    if (!svr.listen(config.http_host, config.http_port)) {
        Logger::Error("S3 endpoint failed to listen on port " + std::to_string(config.http_port), kComponent);
    }
}
