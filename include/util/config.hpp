#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ingest {

// Returns the value of an environment variable, if set.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

EnvLookup ProcessEnvironment();

// Runtime configuration, assembled once at startup from an optional JSON file
// and then the process environment.
struct Config {
    std::string scratch_root;
    std::string dest_bucket;

    // Object store
    std::string endpoint;
    std::string region = "us-east-1";
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    int store_connect_timeout_sec = 120;
    int store_read_timeout_sec = 600;
    int store_max_attempts = 10;

    // Upload
    std::uint64_t multipart_threshold_bytes = 25ULL * 1024 * 1024;
    std::uint64_t part_size_bytes = 100ULL * 1024 * 1024;
    int max_concurrency = 10;
    int upload_attempts = 3;
    std::vector<std::string> transient_upload_codes{"InvalidPart"};

    // Download
    int download_attempts = 3;
    int connect_timeout_sec = 120;
    int read_timeout_sec = 7200;

    std::string status_file;
    std::string log_level = "info";

    Result LoadFile(const std::string& path);
    void ApplyEnvironment(const EnvLookup& env);
    // Everything a transfer needs.
    Result Validate() const;
    // Only what talking to the object store needs.
    Result ValidateStore() const;
};

} // namespace ingest
