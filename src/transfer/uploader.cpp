#include "transfer/uploader.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/worker_group.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <mutex>

namespace ingest {

TransientUploadPredicate MakeBackendCodePredicate(std::vector<std::string> codes) {
    return [codes = std::move(codes)](const Result& r) {
        if (r.ok || r.code.empty()) return false;
        return std::find(codes.begin(), codes.end(), r.code) != codes.end();
    };
}

ResilientUploader::ResilientUploader(IObjectStore& store, UploadOptions options, IEventSink* events)
    : store_(store), options_(std::move(options)), events_(events) {
    is_transient_ = options_.is_transient ? options_.is_transient
                                          : MakeBackendCodePredicate(options_.transient_codes);
}

Result ResilientUploader::Upload(const std::string& local_path,
                                 const std::string& bucket,
                                 const std::string& key,
                                 std::string_view file_id) {
    if (options_.part_size == 0 || options_.max_concurrency <= 0) {
        return Result::Fail(ErrorKind::Config, EINVAL, "invalid upload part size or concurrency");
    }

    FileReader file;
    auto r = FileReader::Open(local_path, file);
    if (!r.is_ok()) return r;

    const auto total = file.TotalSize();
    if (!total) {
        return Result::Fail(EIO, "cannot determine size of " + local_path);
    }
    const std::uint64_t size = *total;

    auto attempt = [&](int) {
        Result res = UploadOnce(file, size, bucket, key);
        if (res.ok) return res;
        // Only codes the predicate accepts are repeated here; lower-level
        // transient failures were already retried by the store client.
        if (is_transient_(res)) {
            res.kind = ErrorKind::TransientUpload;
        } else if (res.kind == ErrorKind::TransientIo || res.kind == ErrorKind::TransientUpload) {
            res.kind = ErrorKind::Backend;
        }
        return res;
    };

    auto on_retry = [&](int n, const Result& failed) {
        LogWarn("upload %s attempt %d/%d failed (%s), retrying",
                key.c_str(), n, options_.retry.max_attempts, failed.msg.c_str());
        Emit(events_, TransferEvent{.type = EventType::Retry,
                                    .file_id = file_id,
                                    .phase = Phase::Uploading,
                                    .attempt = n,
                                    .max_attempts = options_.retry.max_attempts,
                                    .message = failed.msg});
    };

    auto out = RunWithRetry(options_.retry, attempt, on_retry);
    if (out.result.ok) return out.result;

    if (out.exhausted) {
        Result ex = out.result;
        ex.kind = ErrorKind::Exhausted;
        ex.msg = "upload of " + key + " failed after " + std::to_string(out.attempts) +
                 " attempts: " + out.result.msg;
        return ex;
    }
    return out.result.Wrap("upload of " + key);
}

Result ResilientUploader::UploadOnce(const FileReader& file,
                                     std::uint64_t size,
                                     const std::string& bucket,
                                     const std::string& key) {
    if (size < options_.multipart_threshold) {
        LogDebug("PutObject %s (%llu bytes)", key.c_str(), (unsigned long long)size);
        return store_.PutObject(bucket, key, file);
    }
    return UploadMultipart(file, size, bucket, key);
}

Result ResilientUploader::UploadMultipart(const FileReader& file,
                                          std::uint64_t size,
                                          const std::string& bucket,
                                          const std::string& key) {
    std::string upload_id;
    auto r = store_.CreateMultipartUpload(bucket, key, upload_id);
    if (!r.is_ok()) return r;

    const std::uint64_t part_size = options_.part_size;
    const std::size_t part_count =
        static_cast<std::size_t>(std::max<std::uint64_t>(1, (size + part_size - 1) / part_size));
    const int workers =
        static_cast<int>(std::min<std::size_t>(part_count, static_cast<std::size_t>(options_.max_concurrency)));

    LogDebug("multipart %s: %zu parts of %llu bytes, %d workers",
             key.c_str(), part_count, (unsigned long long)part_size, workers);

    std::vector<CompletedPart> parts(part_count);
    std::atomic<std::size_t> next{0};
    std::atomic_bool failed{false};
    std::mutex err_mu;
    Result first_error = Result::Ok();

    auto worker = [&] {
        while (!failed.load()) {
            const std::size_t idx = next.fetch_add(1);
            if (idx >= part_count) return;

            if (CancelRequested()) {
                std::lock_guard<std::mutex> lk(err_mu);
                if (!failed.exchange(true)) {
                    first_error = Result::Fail(ErrorKind::Cancelled, ECANCELED, "upload cancelled");
                }
                return;
            }

            const std::uint64_t offset = idx * part_size;
            const std::uint64_t length = std::min(part_size, size - offset);
            const int part_number = static_cast<int>(idx) + 1;

            std::string etag;
            auto pr = store_.UploadPart(bucket, key, upload_id, part_number, file, offset, length, etag);
            if (!pr.is_ok()) {
                std::lock_guard<std::mutex> lk(err_mu);
                if (!failed.exchange(true)) first_error = std::move(pr);
                return;
            }
            parts[idx] = CompletedPart{.part_number = part_number, .etag = std::move(etag)};
        }
    };

    RunWorkers(workers, worker);

    if (!failed.load()) {
        r = store_.CompleteMultipartUpload(bucket, key, upload_id, parts);
        if (r.is_ok()) return r;
        first_error = std::move(r);
    }

    auto ar = store_.AbortMultipartUpload(bucket, key, upload_id);
    if (!ar.is_ok()) {
        LogWarn("abort of multipart upload %s failed: %s", key.c_str(), ar.msg.c_str());
    }
    return first_error;
}

} // namespace ingest
