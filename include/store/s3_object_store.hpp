#pragma once

#include "net/http_client.hpp"
#include "store/object_store.hpp"
#include "store/s3_signer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ingest {

using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;

struct S3Options {
    std::string endpoint; // scheme://host[:port], path-style addressing
    std::string region = "us-east-1";
    S3Credentials credentials;
    HttpTimeouts timeouts{std::chrono::seconds(120), std::chrono::seconds(600)};

    // Low-level retry of throttling, 5xx and dropped connections.
    int max_attempts = 10;
    std::chrono::milliseconds base_backoff{100};
    std::chrono::milliseconds max_backoff{20000};
};

// Errors S3 reports with a retryable meaning regardless of the operation.
bool IsThrottlingOrServerError(long status, const std::string& code);

// Pulls <Code> and <Message> out of an S3 XML error document.
bool ParseS3Error(const std::string& body, std::string& out_code, std::string& out_message);

class S3ObjectStore final : public IObjectStore {
  public:
    S3ObjectStore(S3Options options, HttpClientFactory client_factory);

    Result PutObject(const std::string& bucket,
                     const std::string& key,
                     const FileReader& file) override;

    Result CreateMultipartUpload(const std::string& bucket,
                                 const std::string& key,
                                 std::string& out_upload_id) override;

    Result UploadPart(const std::string& bucket,
                      const std::string& key,
                      const std::string& upload_id,
                      int part_number,
                      const FileReader& file,
                      std::uint64_t offset,
                      std::uint64_t length,
                      std::string& out_etag) override;

    Result CompleteMultipartUpload(const std::string& bucket,
                                   const std::string& key,
                                   const std::string& upload_id,
                                   const std::vector<CompletedPart>& parts) override;

    Result AbortMultipartUpload(const std::string& bucket,
                                const std::string& key,
                                const std::string& upload_id) override;

  private:
    std::string ObjectUrl(const std::string& bucket, const std::string& key) const;

    // Signs and sends `req`, retrying retryable failures with adaptive backoff.
    Result Send(const std::string& op, HttpRequest req, std::string_view payload_hash,
                HttpResponse& out);
    Result SendOnce(const HttpRequest& req, HttpResponse& out);
    std::chrono::milliseconds BackoffFor(int attempt) const;

    std::unique_ptr<IHttpClient> AcquireClient();
    void ReleaseClient(std::unique_ptr<IHttpClient> client);

    S3Options options_;
    S3Signer signer_;
    HttpClientFactory client_factory_;

    std::mutex pool_mu_;
    std::vector<std::unique_ptr<IHttpClient>> idle_clients_;

    // Grows while the backend throttles, decays on success.
    std::atomic<int> throttle_level_{0};
};

} // namespace ingest
