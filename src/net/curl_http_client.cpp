#include "net/curl_http_client.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace ingest {

namespace {

std::once_flag g_curl_init;

struct SlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

std::string Trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

struct TransferCtx {
    CURL* curl = nullptr;
    const HttpRequest* req = nullptr;
    HttpResponse* resp = nullptr;
    IBodySink* sink = nullptr;

    bool started = false;
    Result sink_result;

    // Request body cursor.
    std::uint64_t sent = 0;
};

size_t HeaderCb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* ctx = static_cast<TransferCtx*>(userdata);
    std::string_view line(buffer, total);

    // A new status line starts a new response (redirect or 100-continue).
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->resp->headers.clear();
        ctx->resp->content_length.reset();
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) return total;

    HttpHeader h{Trim(line.substr(0, colon)), Trim(line.substr(colon + 1))};
    std::string lower = h.name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "content-length") {
        std::uint64_t v = 0;
        auto r = std::from_chars(h.value.data(), h.value.data() + h.value.size(), v);
        if (r.ec == std::errc()) ctx->resp->content_length = v;
    }
    ctx->resp->headers.push_back(std::move(h));
    return total;
}

bool StartResponse(TransferCtx* ctx) {
    if (ctx->started) return true;
    ctx->started = true;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->resp->status);
    if (ctx->sink) {
        ctx->sink_result = ctx->sink->OnResponseStart(*ctx->resp);
        return ctx->sink_result.is_ok();
    }
    return true;
}

size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* ctx = static_cast<TransferCtx*>(userdata);

    if (!StartResponse(ctx)) return 0;

    if (!ctx->sink) {
        ctx->resp->body.append(ptr, total);
        return total;
    }
    ctx->sink_result = ctx->sink->OnData(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(ptr), total));
    if (!ctx->sink_result.is_ok()) return 0; // CURLE_WRITE_ERROR
    return total;
}

size_t ReadCb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    const HttpRequest& req = *ctx->req;
    const std::uint64_t remaining = req.BodySize() - ctx->sent;
    const size_t want = static_cast<size_t>(std::min<std::uint64_t>(size * nitems, remaining));
    if (want == 0) return 0;

    if (req.body_file) {
        const ssize_t n = req.body_file->ReadAt(
            std::span<std::uint8_t>(reinterpret_cast<std::uint8_t*>(buffer), want),
            req.body_offset + ctx->sent);
        if (n <= 0) return CURL_READFUNC_ABORT;
        ctx->sent += static_cast<std::uint64_t>(n);
        return static_cast<size_t>(n);
    }

    std::memcpy(buffer, req.body.data() + ctx->sent, want);
    ctx->sent += want;
    return want;
}

int XferInfoCb(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return CancelRequested() ? 1 : 0;
}

} // namespace

ErrorKind ClassifyCurlError(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return ErrorKind::None;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_BAD_CONTENT_ENCODING:
            return ErrorKind::TransientIo;
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorKind::Cancelled;
        case CURLE_HTTP_RETURNED_ERROR:
            return ErrorKind::Backend;
        default:
            return ErrorKind::Io;
    }
}

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    handle_ = curl_easy_init();
    if (!handle_) {
        throw std::runtime_error("curl_easy_init failed");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (handle_) curl_easy_cleanup(handle_);
}

Result CurlHttpClient::Perform(const HttpRequest& req, HttpResponse& out, IBodySink* sink) {
    out = HttpResponse{};
    curl_easy_reset(handle_);
    CURL* curl = handle_;

    TransferCtx ctx;
    ctx.curl = curl;
    ctx.req = &req;
    ctx.resp = &out;
    ctx.sink = sink;

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    auto append_header = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (next) {
            (void)headers.release();
            headers.reset(next);
        }
    };
    for (const auto& h : req.headers) {
        append_header(h.name + ": " + h.value);
    }
    // Suppress 100-continue round trips on part uploads.
    append_header("Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(req.timeouts.connect.count()));
    // Read timeout: abort when fewer than 1 byte/s moves for the whole window.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(req.timeouts.read.count()));

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, XferInfoCb);
    if (req.fail_on_http_error) {
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    }

    if (req.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (req.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (req.HasBody()) {
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, ReadCb);
        curl_easy_setopt(curl, CURLOPT_READDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(req.BodySize()));
        if (req.method != "PUT") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        }
    } else if (req.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }

    const CURLcode rc = curl_easy_perform(curl);

    if (rc == CURLE_OK) {
        // Responses without a body never reach WriteCb.
        if (!StartResponse(&ctx)) return ctx.sink_result;
        return Result::Ok();
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);

    if (rc == CURLE_WRITE_ERROR && !ctx.sink_result.is_ok()) {
        return ctx.sink_result;
    }

    const ErrorKind kind = ClassifyCurlError(rc);
    std::string msg = std::string(req.method) + " " + req.url + ": " + curl_easy_strerror(rc);
    if (kind == ErrorKind::Backend) {
        return Result::BackendFail(static_cast<int>(out.status), "",
                                   req.method + " " + req.url + ": HTTP " +
                                       std::to_string(out.status));
    }
    if (kind == ErrorKind::Cancelled) {
        return Result::Fail(ErrorKind::Cancelled, static_cast<int>(rc), msg + " (cancelled)");
    }
    LogDebug("curl %s failed: %s", req.method.c_str(), curl_easy_strerror(rc));
    return Result::Fail(kind, static_cast<int>(rc), msg);
}

} // namespace ingest
