#pragma once

#include "io/file_reader.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ingest {

struct HttpHeader {
    std::string name;
    std::string value;
};

struct HttpTimeouts {
    std::chrono::seconds connect{120};
    // Longest tolerated stall while the body is moving, not a total deadline.
    std::chrono::seconds read{7200};
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<HttpHeader> headers;

    // Request body, either from memory or streamed from a file range.
    std::span<const std::uint8_t> body;
    const FileReader* body_file = nullptr;
    std::uint64_t body_offset = 0;
    std::uint64_t body_length = 0;

    HttpTimeouts timeouts;

    // Treat status >= 400 as a Backend failure before any body is delivered.
    bool fail_on_http_error = false;

    bool HasBody() const { return body_file != nullptr || !body.empty(); }
    std::uint64_t BodySize() const { return body_file ? body_length : body.size(); }
};

struct HttpResponse {
    long status = 0;
    std::vector<HttpHeader> headers;
    std::optional<std::uint64_t> content_length;
    // Filled only when no body sink is supplied.
    std::string body;

    // Case-insensitive header lookup; empty when absent.
    std::string Header(std::string_view name) const;
};

class IBodySink {
  public:
    virtual ~IBodySink() = default;
    // Called once the status line and headers are known, before any data.
    virtual Result OnResponseStart(const HttpResponse& head) {
        (void)head;
        return Result::Ok();
    }
    // Returning a failure aborts the transfer; Perform() reports that failure.
    virtual Result OnData(std::span<const std::uint8_t> chunk) = 0;
};

class IHttpClient {
  public:
    virtual ~IHttpClient() = default;

    // Transport failures come back as TransientIo (worth retrying), Io or
    // Cancelled. HTTP error statuses are returned in `out.status` unless the
    // request asks for fail_on_http_error.
    virtual Result Perform(const HttpRequest& req, HttpResponse& out, IBodySink* sink) = 0;

    Result Perform(const HttpRequest& req, HttpResponse& out) { return Perform(req, out, nullptr); }
};

} // namespace ingest
