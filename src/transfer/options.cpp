#include "transfer/options.hpp"

namespace ingest {

DownloadOptions DownloadOptionsFrom(const Config& cfg) {
    DownloadOptions o;
    o.timeouts.connect = std::chrono::seconds(cfg.connect_timeout_sec);
    o.timeouts.read = std::chrono::seconds(cfg.read_timeout_sec);
    o.retry.max_attempts = cfg.download_attempts;
    return o;
}

UploadOptions UploadOptionsFrom(const Config& cfg) {
    UploadOptions o;
    o.multipart_threshold = cfg.multipart_threshold_bytes;
    o.part_size = cfg.part_size_bytes;
    o.max_concurrency = cfg.max_concurrency;
    o.retry.max_attempts = cfg.upload_attempts;
    o.transient_codes = cfg.transient_upload_codes;
    return o;
}

S3Options S3OptionsFrom(const Config& cfg) {
    S3Options o;
    o.endpoint = cfg.endpoint;
    o.region = cfg.region.empty() ? std::string("us-east-1") : cfg.region;
    o.credentials.access_key_id = cfg.access_key_id;
    o.credentials.secret_access_key = cfg.secret_access_key;
    o.credentials.session_token = cfg.session_token;
    o.timeouts.connect = std::chrono::seconds(cfg.store_connect_timeout_sec);
    o.timeouts.read = std::chrono::seconds(cfg.store_read_timeout_sec);
    o.max_attempts = cfg.store_max_attempts;
    return o;
}

} // namespace ingest
