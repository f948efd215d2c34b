#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

Config& Config::Instance() {
    static Config instance;
    return instance;
}

void Config::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::Warn("Config file not found at " + path + ". Using defaults.", "Config");
        return;
    }

    try {
        nlohmann::json j;
        file >> j;
        ServerConfig previous = config_;
        try {
            Apply(j);
        } catch (...) {
            // Keep the previous values rather than a half-applied document.
            config_ = previous;
            throw;
        }
        Logger::Info("Configuration loaded from " + path, "Config");
    } catch (const std::exception& e) {
        Logger::Error("Failed to parse config file: " + std::string(e.what()), "Config");
    }
}

void Config::Apply(const nlohmann::json& j) {
    if (j.contains("grpc_address")) config_.grpc_address = j["grpc_address"];
    if (j.contains("http_host")) config_.http_host = j["http_host"];
    if (j.contains("http_port")) config_.http_port = j["http_port"];
    if (j.contains("log_level")) config_.log_level = j["log_level"];
    if (j.contains("max_object_size")) config_.max_object_size = j["max_object_size"];

    if (j.contains("storage")) {
        auto& storage = j["storage"];
        if (storage.contains("backend")) config_.storage_backend = storage["backend"];
        if (storage.contains("path")) config_.storage_path = storage["path"];
    }

    if (j.contains("auth")) {
        auto& auth = j["auth"];
        if (auth.contains("enabled")) config_.auth_enabled = auth["enabled"];
        if (auth.contains("access_key")) config_.access_key = auth["access_key"];
        if (auth.contains("secret_key")) config_.secret_key = auth["secret_key"];
        if (auth.contains("region")) config_.region = auth["region"];
    }

    if (j.contains("tls")) {
        auto& tls = j["tls"];
        if (tls.contains("cert_dir")) config_.tls_cert_dir = tls["cert_dir"];
    }
}

void Config::ApplyEnvironment() {
    if (const char* v = std::getenv("S3CORE_ACCESS_KEY")) config_.access_key = v;
    if (const char* v = std::getenv("S3CORE_SECRET_KEY")) config_.secret_key = v;
    if (const char* v = std::getenv("S3CORE_STORAGE_PATH")) config_.storage_path = v;
    if (const char* v = std::getenv("S3CORE_LOG_LEVEL")) config_.log_level = v;
}

const Config::ServerConfig& Config::Get() const {
    return config_;
}
