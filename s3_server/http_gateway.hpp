#ifndef HTTP_GATEWAY_HPP
#define HTTP_GATEWAY_HPP

#include <functional>
#include <string>
#include "config.hpp"
#include "s3_error.hpp"
#include "storage_engine.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

// Path-style S3 REST endpoint over a StorageEngine:
//
//   GET /                 ListBuckets
//   PUT|GET|HEAD|DELETE   /{bucket}         CreateBucket, ListObjects, HeadBucket, DeleteBucket
//   PUT|GET|HEAD|DELETE   /{bucket}/{key}   PutObject, GetObject, HeadObject, DeleteObject
class S3Gateway {
public:
    S3Gateway(StorageEngine& engine, const Config::ServerConfig& config);

    // Installs the routes and the request logger on svr. The gateway must
    // outlive svr's listen loop.
    void Register(httplib::Server& svr);

private:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    StorageEngine& engine_;
    Config::ServerConfig config_;

    // Authenticates, then runs handler. Exceptions become InternalError.
    void Serve(const httplib::Request& req, httplib::Response& res, const Handler& handler);

    S3Error Authenticate(const httplib::Request& req);

    void ListBuckets(const httplib::Request& req, httplib::Response& res);
    void CreateBucket(const httplib::Request& req, httplib::Response& res);
    void ListObjects(const httplib::Request& req, httplib::Response& res);
    void DeleteBucket(const httplib::Request& req, httplib::Response& res);
    void PutObject(const httplib::Request& req, httplib::Response& res);
    void GetObject(const httplib::Request& req, httplib::Response& res);
    void DeleteObject(const httplib::Request& req, httplib::Response& res);

    static void SendError(const httplib::Request& req, httplib::Response& res, S3Error error,
                          const std::string& message = "");
};

// Starts the S3 endpoint on config.http_host:config.http_port in a blocking
// loop (intended to be run in a thread).
void RunHTTPServer(StorageEngine& engine, const Config::ServerConfig& config);

#endif // HTTP_GATEWAY_HPP
