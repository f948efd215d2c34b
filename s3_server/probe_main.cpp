// Replays the client smoke flow against a running endpoint:
// create bucket, put, get, list, delete object, then list -> delete each ->
// delete bucket.
//
// usage: s3_probe <endpoint> <access_key> <secret_key> [bucket] [--insecure]

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "logger.hpp"
#include "s3_client.hpp"

namespace {

const char* kComponent = "Probe";

bool Check(S3Error err, const std::string& what, const S3Client& client) {
    if (err == S3Error::None) {
        Logger::Info(what + " OK", kComponent);
        return true;
    }
    Logger::Error(what + " failed: " + ErrorCode(err) + " (" + client.last_message() + ")", kComponent);
    return false;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <endpoint> <access_key> <secret_key> [bucket] [--insecure]"
                  << std::endl;
        return EXIT_FAILURE;
    }

    std::string endpoint = argv[1];
    SigV4Credentials creds;
    creds.access_key = argv[2];
    creds.secret_key = argv[3];

    std::string bucket = "mybucket";
    bool verify_tls = true;
    for (int i = 4; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--insecure") {
            verify_tls = false;
        } else {
            bucket = arg;
        }
    }

    const std::string key = "hello.txt";
    const std::string body = "Hello World from Python";

    S3Client client(endpoint, creds, verify_tls);
    bool ok = true;

    S3Error err = client.CreateBucket(bucket);
    if (err == S3Error::BucketAlreadyExists) {
        Logger::Info("Bucket '" + bucket + "' already exists.", kComponent);
    } else if (!Check(err, "CreateBucket " + bucket, client)) {
        return EXIT_FAILURE;
    }

    ok &= Check(client.PutObject(bucket, key, body), "PutObject " + key, client);

    std::string downloaded;
    if (Check(client.GetObject(bucket, key, &downloaded), "GetObject " + key, client) && downloaded != body) {
        Logger::Error("Downloaded content does not match: " + downloaded, kComponent);
        ok = false;
    }

    std::vector<std::string> keys;
    if (Check(client.ListObjects(bucket, &keys), "ListObjects " + bucket, client)) {
        for (const auto& k : keys) {
            Logger::Info("- " + k, kComponent);
        }
    } else {
        ok = false;
    }

    ok &= Check(client.DeleteObject(bucket, key), "DeleteObject " + key, client);

    // Two-phase teardown: the server never deletes a non-empty bucket.
    keys.clear();
    if (Check(client.ListObjects(bucket, &keys), "ListObjects " + bucket, client)) {
        for (const auto& k : keys) {
            ok &= Check(client.DeleteObject(bucket, k), "DeleteObject " + k, client);
        }
    } else {
        ok = false;
    }
    ok &= Check(client.DeleteBucket(bucket), "DeleteBucket " + bucket, client);

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
