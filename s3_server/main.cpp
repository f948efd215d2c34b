#include <iostream>
#include <string>
#include <thread>
#include <memory>
#include <filesystem>
#include <exception>
#include <cstdlib>
#include <utility>

#include "config.hpp"
#include "http_gateway.hpp"
#include "logger.hpp"
#include "memory_blob_store.hpp"
#include "sqlite_blob_store.hpp"
#include "storage_engine.hpp"
#include "storage_service.hpp"

std::unique_ptr<BlobStore> MakeBlobStore(const Config::ServerConfig& config) {
    if (config.storage_backend == "sqlite") {
        std::filesystem::path db_path(config.storage_path);
        if (db_path.has_parent_path()) {
            std::filesystem::create_directories(db_path.parent_path());
        }
        Logger::Info("Using SQLite blob store at " + config.storage_path);
        return std::make_unique<SqliteBlobStore>(config.storage_path);
    }
    if (config.storage_backend != "memory") {
        Logger::Warn("Unknown storage backend '" + config.storage_backend + "', falling back to memory");
    }
    Logger::Info("Using in-memory blob store");
    return std::make_unique<MemoryBlobStore>();
}

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : "config.json";

    Config::Instance().Load(config_path);
    Config::Instance().ApplyEnvironment();
    Config::ServerConfig config = Config::Instance().Get();
    Logger::SetLevel(Logger::ParseLevel(config.log_level));

    if (config.auth_enabled && (config.access_key.empty() || config.secret_key.empty())) {
        Logger::Fatal("auth.enabled requires auth.access_key and auth.secret_key");
        return EXIT_FAILURE;
    }

    std::unique_ptr<StorageEngine> engine;
    try {
        std::unique_ptr<BlobStore> blobs = MakeBlobStore(config);
        if (config.max_object_size > blobs->MaxBlobSize()) {
            Logger::Warn("max_object_size " + std::to_string(config.max_object_size) +
                         " exceeds what the " + config.storage_backend + " backend can store; using " +
                         std::to_string(blobs->MaxBlobSize()));
            config.max_object_size = blobs->MaxBlobSize();
        }
        engine = std::make_unique<StorageEngine>(std::move(blobs));
    } catch (const std::exception& e) {
        Logger::Fatal("Failed to initialise storage: " + std::string(e.what()));
        return EXIT_FAILURE;
    }

    // Start the S3 endpoint in a separate thread
    std::thread http_thread([&engine, &config]() {
        RunHTTPServer(*engine, config);
    });
    http_thread.detach();

    try {
        RunGrpcServer(*engine, config);
    } catch (const std::exception& e) {
        // exit() rather than return: the detached HTTP thread still uses engine.
        Logger::Fatal(e.what());
        exit(EXIT_FAILURE);
    }

    return 0;
}
