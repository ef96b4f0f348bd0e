#pragma once

#include "net/http_client.hpp"
#include "util/result.hpp"

#include <ctime>
#include <string>
#include <string_view>

namespace ingest {

struct S3Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
};

// Hash value S3 accepts in place of a body digest over TLS.
inline constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";

// RFC 3986 encoding as AWS SigV4 expects it. '/' is kept when keep_slash.
std::string UriEncode(std::string_view s, bool keep_slash);

// AWS Signature Version 4 for the S3 REST API.
class S3Signer {
  public:
    S3Signer(S3Credentials credentials, std::string region, std::string service = "s3");

    // Adds host, x-amz-date, x-amz-content-sha256, optional
    // x-amz-security-token and Authorization headers to `req`. The URL path
    // and query must already be URI-encoded.
    Result Sign(HttpRequest& req, std::string_view payload_hash, std::time_t now) const;

    const std::string& Region() const { return region_; }

  private:
    S3Credentials credentials_;
    std::string region_;
    std::string service_;
};

} // namespace ingest
