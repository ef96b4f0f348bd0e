#include "util/config_json_utils.hpp"

#include <fstream>
#include <limits>

namespace ingest::config::detail {

namespace {

// Each getter leaves `out` untouched when the key is absent and reports a
// present key of the wrong type through `err`.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!(it->is_number_unsigned() || it->is_number_integer()) || it->get<long long>() < 0) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(it->get<long long>());
    return true;
}

bool GetIntIfPresent(const nlohmann::json& j, const char* key, int& out, std::string& err) {
    std::uint64_t v = 0;
    if (j.find(key) == j.end()) return true;
    if (!GetU64IfPresent(j, key, v, err)) return false;
    if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        err = std::string(key) + " is out of range";
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool GetStringListIfPresent(const nlohmann::json& j,
                            const char* key,
                            std::vector<std::string>& out,
                            std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, Config& cfg, std::string& err) {
    return GetStringIfPresent(j, "ScratchRoot", cfg.scratch_root, err) &&
           GetStringIfPresent(j, "DestBucket", cfg.dest_bucket, err) &&
           GetStringIfPresent(j, "Endpoint", cfg.endpoint, err) &&
           GetStringIfPresent(j, "Region", cfg.region, err) &&
           GetStringIfPresent(j, "AccessKeyId", cfg.access_key_id, err) &&
           GetStringIfPresent(j, "SecretAccessKey", cfg.secret_access_key, err) &&
           GetStringIfPresent(j, "SessionToken", cfg.session_token, err) &&
           GetU64IfPresent(j, "MultipartThresholdBytes", cfg.multipart_threshold_bytes, err) &&
           GetU64IfPresent(j, "PartSizeBytes", cfg.part_size_bytes, err) &&
           GetIntIfPresent(j, "MaxConcurrency", cfg.max_concurrency, err) &&
           GetIntIfPresent(j, "DownloadAttempts", cfg.download_attempts, err) &&
           GetIntIfPresent(j, "UploadAttempts", cfg.upload_attempts, err) &&
           GetStringListIfPresent(j, "TransientUploadCodes", cfg.transient_upload_codes, err) &&
           GetIntIfPresent(j, "ConnectTimeoutSec", cfg.connect_timeout_sec, err) &&
           GetIntIfPresent(j, "ReadTimeoutSec", cfg.read_timeout_sec, err) &&
           GetIntIfPresent(j, "StoreConnectTimeoutSec", cfg.store_connect_timeout_sec, err) &&
           GetIntIfPresent(j, "StoreReadTimeoutSec", cfg.store_read_timeout_sec, err) &&
           GetIntIfPresent(j, "StoreMaxAttempts", cfg.store_max_attempts, err) &&
           GetStringIfPresent(j, "StatusFile", cfg.status_file, err) &&
           GetStringIfPresent(j, "LogLevel", cfg.log_level, err);
}

} // namespace ingest::config::detail
