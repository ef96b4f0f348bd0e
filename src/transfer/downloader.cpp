#include "transfer/downloader.hpp"

#include "crypto/checksum_verifier.hpp"
#include "io/file_writer.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace ingest {

namespace {

void RemovePartial(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        LogWarn("failed to remove partial download %s: %s", path.c_str(), std::strerror(errno));
    }
}

// Re-blocks the response body into fixed chunks, each written to disk and fed
// to the running digest before the next one is taken.
class ChunkedFileSink final : public IBodySink {
public:
    ChunkedFileSink(FileWriter& writer,
                    ChecksumVerifier& verifier,
                    std::size_t chunk_size,
                    std::int64_t expected_size,
                    std::string_view file_id,
                    IEventSink* events)
        : writer_(writer),
          verifier_(verifier),
          chunk_size_(chunk_size),
          file_id_(file_id),
          events_(events) {
        if (expected_size > 0) total_ = static_cast<std::uint64_t>(expected_size);
        buf_.reserve(chunk_size_);
    }

    Result OnResponseStart(const HttpResponse& head) override {
        if (total_ == 0 && head.content_length) total_ = *head.content_length;
        return Result::Ok();
    }

    Result OnData(std::span<const std::uint8_t> data) override {
        if (CancelRequested()) {
            return Result::Fail(ErrorKind::Cancelled, ECANCELED, "download cancelled");
        }
        while (!data.empty()) {
            const std::size_t take = std::min(chunk_size_ - buf_.size(), data.size());
            buf_.insert(buf_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(take));
            data = data.subspan(take);
            if (buf_.size() == chunk_size_) {
                auto r = FlushChunk();
                if (!r.is_ok()) return r;
            }
        }
        return Result::Ok();
    }

    Result Finish() { return buf_.empty() ? Result::Ok() : FlushChunk(); }

    std::uint64_t Bytes() const { return done_; }

private:
    Result FlushChunk() {
        auto r = writer_.WriteAll(buf_);
        if (!r.is_ok()) return r;
        verifier_.Update(buf_);
        done_ += buf_.size();
        buf_.clear();
        ReportProgress();
        return Result::Ok();
    }

    void ReportProgress() {
        if (total_ == 0) return;
        const int pct = static_cast<int>(std::min<std::uint64_t>(100, (done_ * 100ULL) / total_));
        if (pct < last_reported_ + 10) return;
        last_reported_ = pct - (pct % 10);
        Emit(events_, TransferEvent{.type = EventType::Progress,
                                    .file_id = file_id_,
                                    .phase = Phase::Downloading,
                                    .percent = pct,
                                    .bytes_done = done_,
                                    .bytes_total = total_});
    }

    FileWriter& writer_;
    ChecksumVerifier& verifier_;
    std::size_t chunk_size_;
    std::string_view file_id_;
    IEventSink* events_;

    std::vector<std::uint8_t> buf_;
    std::uint64_t total_ = 0;
    std::uint64_t done_ = 0;
    int last_reported_ = 0;
};

} // namespace

StreamingDownloader::StreamingDownloader(IHttpClient& http, DownloadOptions options, IEventSink* events)
    : http_(http), options_(std::move(options)), events_(events) {
    if (options_.chunk_size == 0) options_.chunk_size = 1024 * 1024;
}

Result StreamingDownloader::Download(const DownloadRequest& req, DownloadResult& out) {
    if (req.destination_path.empty()) {
        return Result::Fail(ErrorKind::Config, EINVAL, "download destination is empty");
    }

    LogInfo("downloading %s from %s", req.file_id.c_str(), req.source_url.c_str());

    auto attempt = [&](int) { return DownloadOnce(req, out); };
    auto on_retry = [&](int n, const Result& failed) {
        LogWarn("download attempt %d/%d for %s failed: %s",
                n, options_.retry.max_attempts, req.file_id.c_str(), failed.msg.c_str());
        Emit(events_, TransferEvent{.type = EventType::Retry,
                                    .file_id = req.file_id,
                                    .phase = Phase::Downloading,
                                    .attempt = n,
                                    .max_attempts = options_.retry.max_attempts,
                                    .message = failed.msg});
    };

    auto run = RunWithRetry(options_.retry, attempt, on_retry);
    out.attempts = run.attempts;
    if (run.result.ok) {
        LogInfo("downloaded %s (%llu bytes, md5 %s)",
                req.file_id.c_str(), (unsigned long long)out.bytes, out.md5.c_str());
        return run.result;
    }

    if (run.exhausted) {
        LogError("all %d download attempts failed for %s", run.attempts, req.file_id.c_str());
        Result ex = run.result;
        ex.kind = ErrorKind::Exhausted;
        ex.msg = "download of " + req.file_id + " failed after " + std::to_string(run.attempts) +
                 " attempts: " + run.result.msg;
        return ex;
    }
    return run.result;
}

Result StreamingDownloader::DownloadOnce(const DownloadRequest& req, DownloadResult& out) {
    out.bytes = 0;
    out.md5.clear();

    FileWriter writer;
    auto r = FileWriter::Open(req.destination_path, writer);
    if (!r.is_ok()) return r;

    ChecksumVerifier verifier(req.expected_checksum);
    ChunkedFileSink sink(writer, verifier, options_.chunk_size, req.expected_size, req.file_id, events_);

    HttpRequest http_req;
    http_req.method = "GET";
    http_req.url = req.source_url;
    http_req.timeouts = options_.timeouts;
    http_req.fail_on_http_error = true;

    HttpResponse resp;
    r = http_.Perform(http_req, resp, &sink);
    if (r.is_ok()) r = sink.Finish();
    if (r.is_ok()) r = writer.FsyncNow();
    if (r.is_ok()) r = writer.Close();
    if (!r.is_ok()) {
        // Nothing of a failed attempt survives on disk.
        RemovePartial(req.destination_path);
        return r.Wrap(req.file_id);
    }

    out.bytes = sink.Bytes();

    Emit(events_, TransferEvent{.type = EventType::PhaseChanged,
                                .file_id = req.file_id,
                                .phase = Phase::Verifying});
    r = verifier.Finish();
    out.md5 = verifier.ActualHex();
    if (!r.is_ok()) {
        return r.Wrap(req.file_id);
    }
    LogInfo("md5 verified for %s: %s", req.file_id.c_str(), out.md5.c_str());
    return Result::Ok();
}

} // namespace ingest
