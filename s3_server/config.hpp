#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

class Config {
public:
    struct ServerConfig {
        std::string grpc_address = "0.0.0.0:50051";
        std::string http_host = "0.0.0.0";
        int http_port = 8080;
        std::string log_level = "INFO";
        uint64_t max_object_size = 5ULL * 1024 * 1024 * 1024; // 5 GiB, the S3 single-PUT limit

        // Blob storage: "memory" or "sqlite"
        std::string storage_backend = "memory";
        std::string storage_path = "data/blobs.db";

        // SigV4 request authentication for the S3 endpoint
        bool auth_enabled = false;
        std::string access_key = "";
        std::string secret_key = "";
        std::string region = "us-east-1";

        // Directory holding ca.crt, server.crt and server.key for the gRPC
        // listener. Empty means plaintext.
        std::string tls_cert_dir = "";
    };

    static Config& Instance();

    void Load(const std::string& path);

    // Applies a parsed document on top of the current values. Throws
    // nlohmann::json::exception on type mismatches.
    void Apply(const nlohmann::json& j);

    // S3CORE_ACCESS_KEY, S3CORE_SECRET_KEY, S3CORE_STORAGE_PATH, S3CORE_LOG_LEVEL
    void ApplyEnvironment();

    const ServerConfig& Get() const;

    Config() = default;

private:
    ServerConfig config_;
};

#endif // CONFIG_HPP
