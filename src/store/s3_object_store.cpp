#include "store/s3_object_store.hpp"

#include "crypto/digest.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <ctime>
#include <random>
#include <sstream>
#include <thread>

namespace ingest {

namespace {

constexpr const char kEmptySha256[] =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

bool ExtractTag(const std::string& xml, const std::string& tag, std::string& out) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    const auto b = xml.find(open);
    if (b == std::string::npos) return false;
    const auto start = b + open.size();
    const auto e = xml.find(close, start);
    if (e == std::string::npos) return false;
    out = xml.substr(start, e - start);
    return true;
}

bool IsThrottle(long status, const std::string& code) {
    return status == 429 || status == 503 || code == "SlowDown" || code == "Throttling" ||
           code == "ThrottlingException" || code == "RequestLimitExceeded";
}

void SleepUnlessCancelled(std::chrono::milliseconds total) {
    const auto slice = std::chrono::milliseconds(100);
    while (total.count() > 0 && !CancelRequested()) {
        const auto step = std::min(total, slice);
        std::this_thread::sleep_for(step);
        total -= step;
    }
}

} // namespace

bool IsThrottlingOrServerError(long status, const std::string& code) {
    if (IsThrottle(status, code)) return true;
    if (code == "InternalError" || code == "RequestTimeout" || code == "ServiceUnavailable")
        return true;
    return status == 500 || status == 502 || status == 504;
}

bool ParseS3Error(const std::string& body, std::string& out_code, std::string& out_message) {
    if (body.find("<Error>") == std::string::npos) return false;
    out_code.clear();
    out_message.clear();
    (void)ExtractTag(body, "Code", out_code);
    (void)ExtractTag(body, "Message", out_message);
    return true;
}

S3ObjectStore::S3ObjectStore(S3Options options, HttpClientFactory client_factory)
    : options_(std::move(options)),
      signer_(options_.credentials, options_.region),
      client_factory_(std::move(client_factory)) {
    while (!options_.endpoint.empty() && options_.endpoint.back() == '/') {
        options_.endpoint.pop_back();
    }
}

std::string S3ObjectStore::ObjectUrl(const std::string& bucket, const std::string& key) const {
    return options_.endpoint + "/" + UriEncode(bucket, false) + "/" + UriEncode(key, true);
}

std::unique_ptr<IHttpClient> S3ObjectStore::AcquireClient() {
    {
        std::lock_guard<std::mutex> lk(pool_mu_);
        if (!idle_clients_.empty()) {
            auto client = std::move(idle_clients_.back());
            idle_clients_.pop_back();
            return client;
        }
    }
    return client_factory_();
}

void S3ObjectStore::ReleaseClient(std::unique_ptr<IHttpClient> client) {
    if (!client) return;
    std::lock_guard<std::mutex> lk(pool_mu_);
    idle_clients_.push_back(std::move(client));
}

Result S3ObjectStore::SendOnce(const HttpRequest& req, HttpResponse& out) {
    std::unique_ptr<IHttpClient> client;
    try {
        client = AcquireClient();
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Io, -1, std::string("http client init failed: ") + e.what());
    }
    if (!client) return Result::Fail(ErrorKind::Io, -1, "http client init failed");

    Result r = client->Perform(req, out);
    ReleaseClient(std::move(client));
    return r;
}

std::chrono::milliseconds S3ObjectStore::BackoffFor(int attempt) const {
    thread_local std::mt19937 rng{std::random_device{}()};
    const int exponent = std::min(attempt - 1 + throttle_level_.load(), 16);
    const long long base = options_.base_backoff.count();
    const long long cap = std::min<long long>(base << exponent, options_.max_backoff.count());
    if (cap <= 0) return std::chrono::milliseconds(0);
    std::uniform_int_distribution<long long> dist(cap / 2, cap);
    return std::chrono::milliseconds(dist(rng));
}

Result S3ObjectStore::Send(const std::string& op,
                           HttpRequest req,
                           std::string_view payload_hash,
                           HttpResponse& out) {
    req.timeouts = options_.timeouts;
    const int budget = std::max(1, options_.max_attempts);

    Result last;
    for (int attempt = 1; attempt <= budget; ++attempt) {
        HttpRequest signed_req = req;
        auto sign_res = signer_.Sign(signed_req, payload_hash, std::time(nullptr));
        if (!sign_res.is_ok()) return sign_res;

        last = SendOnce(signed_req, out);

        bool retryable = false;
        if (last.is_ok()) {
            std::string code;
            std::string message;
            const bool has_error_doc = ParseS3Error(out.body, code, message);
            // CompleteMultipartUpload may report failure inside a 200 response.
            if (out.status >= 200 && out.status < 300 && !has_error_doc) {
                int level = throttle_level_.load();
                while (level > 0 && !throttle_level_.compare_exchange_weak(level, level - 1)) {
                }
                return Result::Ok();
            }
            if (code.empty()) code = "HTTP" + std::to_string(out.status);
            last = Result::BackendFail(static_cast<int>(out.status),
                                       code,
                                       op + ": HTTP " + std::to_string(out.status) + " " + code +
                                           (message.empty() ? "" : " (" + message + ")"));
            retryable = IsThrottlingOrServerError(out.status, code);
            if (IsThrottle(out.status, code)) {
                throttle_level_.fetch_add(1);
            }
        } else {
            retryable = last.kind == ErrorKind::TransientIo;
        }

        if (!retryable || attempt == budget || CancelRequested()) break;

        const auto delay = BackoffFor(attempt);
        LogWarn("%s attempt %d/%d failed: %s; backing off %lld ms",
                op.c_str(), attempt, budget, last.msg.c_str(), (long long)delay.count());
        SleepUnlessCancelled(delay);
    }
    return last;
}

Result S3ObjectStore::PutObject(const std::string& bucket,
                                const std::string& key,
                                const FileReader& file) {
    HttpRequest req;
    req.method = "PUT";
    req.url = ObjectUrl(bucket, key);
    req.body_file = &file;
    req.body_offset = 0;
    req.body_length = file.TotalSize().value_or(0);

    // An empty body would be sent as no body at all; hash it accordingly.
    const std::string_view hash = req.body_length > 0 ? kUnsignedPayload : kEmptySha256;
    if (req.body_length == 0) req.body_file = nullptr;

    HttpResponse resp;
    return Send("PutObject " + key, std::move(req), hash, resp);
}

Result S3ObjectStore::CreateMultipartUpload(const std::string& bucket,
                                            const std::string& key,
                                            std::string& out_upload_id) {
    HttpRequest req;
    req.method = "POST";
    req.url = ObjectUrl(bucket, key) + "?uploads";

    HttpResponse resp;
    auto r = Send("CreateMultipartUpload " + key, std::move(req), kEmptySha256, resp);
    if (!r.is_ok()) return r;

    if (!ExtractTag(resp.body, "UploadId", out_upload_id) || out_upload_id.empty()) {
        return Result::BackendFail(static_cast<int>(resp.status), "",
                                   "CreateMultipartUpload " + key + ": UploadId not found");
    }
    return Result::Ok();
}

Result S3ObjectStore::UploadPart(const std::string& bucket,
                                 const std::string& key,
                                 const std::string& upload_id,
                                 int part_number,
                                 const FileReader& file,
                                 std::uint64_t offset,
                                 std::uint64_t length,
                                 std::string& out_etag) {
    HttpRequest req;
    req.method = "PUT";
    req.url = ObjectUrl(bucket, key) + "?partNumber=" + std::to_string(part_number) +
              "&uploadId=" + UriEncode(upload_id, false);
    req.body_file = &file;
    req.body_offset = offset;
    req.body_length = length;

    HttpResponse resp;
    const std::string op = "UploadPart " + key + " #" + std::to_string(part_number);
    auto r = Send(op, std::move(req), kUnsignedPayload, resp);
    if (!r.is_ok()) return r;

    out_etag = resp.Header("ETag");
    if (out_etag.empty()) {
        return Result::BackendFail(static_cast<int>(resp.status), "", op + ": missing ETag");
    }
    return Result::Ok();
}

Result S3ObjectStore::CompleteMultipartUpload(const std::string& bucket,
                                              const std::string& key,
                                              const std::string& upload_id,
                                              const std::vector<CompletedPart>& parts) {
    std::ostringstream xml;
    xml << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";
    for (const auto& p : parts) {
        xml << "<Part><PartNumber>" << p.part_number << "</PartNumber><ETag>" << p.etag
            << "</ETag></Part>";
    }
    xml << "</CompleteMultipartUpload>";
    const std::string body = xml.str();

    HttpRequest req;
    req.method = "POST";
    req.url = ObjectUrl(bucket, key) + "?uploadId=" + UriEncode(upload_id, false);
    req.headers.push_back({"Content-Type", "application/xml"});
    req.body = std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(body.data()),
                                             body.size());

    HttpResponse resp;
    return Send("CompleteMultipartUpload " + key, std::move(req), Sha256Hex(body), resp);
}

Result S3ObjectStore::AbortMultipartUpload(const std::string& bucket,
                                           const std::string& key,
                                           const std::string& upload_id) {
    HttpRequest req;
    req.method = "DELETE";
    req.url = ObjectUrl(bucket, key) + "?uploadId=" + UriEncode(upload_id, false);

    HttpResponse resp;
    return Send("AbortMultipartUpload " + key, std::move(req), kEmptySha256, resp);
}

} // namespace ingest
