#pragma once

#include "net/http_client.hpp"
#include "transfer/events.hpp"
#include "util/result.hpp"
#include "util/retry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace ingest {

struct DownloadRequest {
    std::string file_id;
    std::string source_url;
    std::string expected_checksum;
    std::int64_t expected_size = -1; // advisory, used for progress only
    std::string destination_path;
};

struct DownloadResult {
    std::uint64_t bytes = 0;
    std::string md5;
    int attempts = 0;
};

struct DownloadOptions {
    std::size_t chunk_size = 1024 * 1024;
    HttpTimeouts timeouts;
    RetryPolicy retry{.max_attempts = 3};
};

// Streams a URL to disk while computing its MD5 in the same pass.
//
// Transient transport failures restart the download from byte zero after the
// partial file is removed. HTTP error statuses and checksum mismatches are
// terminal. On a checksum mismatch the downloaded file is left in place.
class StreamingDownloader {
public:
    StreamingDownloader(IHttpClient& http, DownloadOptions options, IEventSink* events = nullptr);

    Result Download(const DownloadRequest& req, DownloadResult& out);

private:
    Result DownloadOnce(const DownloadRequest& req, DownloadResult& out);

    IHttpClient& http_;
    DownloadOptions options_;
    IEventSink* events_ = nullptr;
};

} // namespace ingest
