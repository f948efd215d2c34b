#include "s3_client.hpp"
#include "crypto_util.hpp"
#include "logger.hpp"
#include "s3_xml.hpp"
#include <curl/curl.h>
#include <ctime>
#include <map>

namespace {

const char* kComponent = "S3Client";

// Simple write callback for response bodies
size_t WriteCallback(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::string* out = static_cast<std::string*>(stream);
    out->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

std::string AmzDate() {
    time_t now = time(nullptr);
    std::tm gmt{};
    gmtime_r(&now, &gmt);
    char date_iso[20];
    strftime(date_iso, sizeof(date_iso), "%Y%m%dT%H%M%SZ", &gmt);
    return date_iso;
}

} // namespace

S3Client::S3Client(const std::string& endpoint, const SigV4Credentials& creds, bool verify_tls)
    : endpoint_(endpoint), creds_(creds), verify_tls_(verify_tls) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
    size_t scheme_end = endpoint_.find("://");
    host_ = scheme_end == std::string::npos ? endpoint_ : endpoint_.substr(scheme_end + 3);
    curl_global_init(CURL_GLOBAL_ALL);
}

S3Client::~S3Client() {
    curl_global_cleanup();
}

S3Error S3Client::Perform(const std::string& method, const std::string& path, const std::string& body,
                          std::string* response_body) {
    last_message_.clear();
    response_body->clear();

    CURL* curl = curl_easy_init();
    if (!curl) {
        last_message_ = "curl_easy_init failed";
        return S3Error::InternalStorageFailure;
    }

    std::string payload_hash = Sha256Hex(body);
    std::string amz_date = AmzDate();

    std::map<std::string, std::string> signed_headers = {
        {"host", host_},
        {"x-amz-content-sha256", payload_hash},
        {"x-amz-date", amz_date},
    };
    std::string auth = SignRequest(method, path, {}, signed_headers, payload_hash, amz_date, creds_);

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, ("Host: " + host_).c_str());
    headers = curl_slist_append(headers, ("x-amz-date: " + amz_date).c_str());
    headers = curl_slist_append(headers, ("x-amz-content-sha256: " + payload_hash).c_str());
    headers = curl_slist_append(headers, ("Authorization: " + auth).c_str());
    headers = curl_slist_append(headers, "Expect:");

    std::string url = endpoint_ + UriEncode(path, false);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (method == "PUT") {
        headers = curl_slist_append(headers, "Content-Type: application/octet-stream");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, response_body);
    if (!verify_tls_) {
        // Self-signed test endpoints
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        last_message_ = curl_easy_strerror(res);
        Logger::Error(method + " " + path + " failed: " + last_message_, kComponent);
        return S3Error::InternalStorageFailure;
    }

    if (status >= 200 && status < 300) {
        return S3Error::None;
    }

    std::vector<std::string> codes = ExtractElements(*response_body, "Code");
    std::vector<std::string> messages = ExtractElements(*response_body, "Message");
    last_message_ = messages.empty() ? "HTTP " + std::to_string(status) : messages.front();
    if (codes.empty()) {
        Logger::Warn(method + " " + path + " returned HTTP " + std::to_string(status) + " without an error code",
                     kComponent);
        return S3Error::InternalStorageFailure;
    }
    return ErrorFromCode(codes.front());
}

S3Error S3Client::CreateBucket(const std::string& bucket) {
    std::string response;
    return Perform("PUT", "/" + bucket, "", &response);
}

S3Error S3Client::DeleteBucket(const std::string& bucket) {
    std::string response;
    return Perform("DELETE", "/" + bucket, "", &response);
}

S3Error S3Client::PutObject(const std::string& bucket, const std::string& key, const std::string& body) {
    std::string response;
    return Perform("PUT", "/" + bucket + "/" + key, body, &response);
}

S3Error S3Client::GetObject(const std::string& bucket, const std::string& key, std::string* body) {
    return Perform("GET", "/" + bucket + "/" + key, "", body);
}

S3Error S3Client::ListObjects(const std::string& bucket, std::vector<std::string>* keys) {
    std::string response;
    S3Error err = Perform("GET", "/" + bucket, "", &response);
    if (err != S3Error::None) {
        return err;
    }
    *keys = ExtractElements(response, "Key");
    return S3Error::None;
}

S3Error S3Client::DeleteObject(const std::string& bucket, const std::string& key) {
    std::string response;
    return Perform("DELETE", "/" + bucket + "/" + key, "", &response);
}
