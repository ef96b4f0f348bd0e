#include "util/config.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace ingest {

EnvLookup ProcessEnvironment() {
    return [](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

Result Config::LoadFile(const std::string& path) {
    nlohmann::json json;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, EINVAL, "Config: " + err);
    }
    if (!config::detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorKind::Config, EINVAL, "Config: " + err + " in " + path);
    }
    return Result::Ok();
}

void Config::ApplyEnvironment(const EnvLookup& env) {
    auto set = [&env](const char* name, std::string& field) {
        if (auto v = env(name); v && !v->empty()) field = *v;
    };
    set("SCRATCH_PATH", scratch_root);
    set("DEST_BUCKET", dest_bucket);
    set("AWS_S3_ENDPOINT_URL", endpoint);
    set("AWS_REGION", region);
    set("AWS_ACCESS_KEY_ID", access_key_id);
    set("AWS_SECRET_ACCESS_KEY", secret_access_key);
    set("AWS_SESSION_TOKEN", session_token);
}

namespace {

// S3 multipart limits.
constexpr std::uint64_t kMinPartSize = 5ULL * 1024 * 1024;
constexpr std::uint64_t kMaxPartSize = 5ULL * 1024 * 1024 * 1024;

Result ConfigFail(const std::string& m) {
    return Result::Fail(ErrorKind::Config, EINVAL, m);
}

} // namespace

Result Config::Validate() const {
    if (scratch_root.empty()) return ConfigFail("scratch root is not set (ScratchRoot or SCRATCH_PATH)");
    if (download_attempts <= 0) return ConfigFail("DownloadAttempts must be positive");
    if (connect_timeout_sec <= 0 || read_timeout_sec <= 0) {
        return ConfigFail("ConnectTimeoutSec and ReadTimeoutSec must be positive");
    }
    if (!ParseLogLevel(log_level)) return ConfigFail("unknown LogLevel: " + log_level);
    return ValidateStore();
}

Result Config::ValidateStore() const {
    if (dest_bucket.empty()) return ConfigFail("destination bucket is not set (DestBucket or DEST_BUCKET)");
    if (endpoint.empty()) return ConfigFail("object store endpoint is not set (Endpoint or AWS_S3_ENDPOINT_URL)");
    if (endpoint.rfind("http://", 0) != 0 && endpoint.rfind("https://", 0) != 0) {
        return ConfigFail("object store endpoint must start with http:// or https://: " + endpoint);
    }
    if (part_size_bytes < kMinPartSize || part_size_bytes > kMaxPartSize) {
        return ConfigFail("PartSizeBytes must be between 5 MiB and 5 GiB, got " + std::to_string(part_size_bytes));
    }
    if (store_connect_timeout_sec <= 0 || store_read_timeout_sec <= 0) {
        return ConfigFail("StoreConnectTimeoutSec and StoreReadTimeoutSec must be positive");
    }
    if (max_concurrency <= 0) return ConfigFail("MaxConcurrency must be positive");
    if (upload_attempts <= 0 || store_max_attempts <= 0) {
        return ConfigFail("UploadAttempts and StoreMaxAttempts must be positive");
    }
    return Result::Ok();
}

} // namespace ingest
