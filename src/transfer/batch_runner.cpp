#include "transfer/batch_runner.hpp"

#include "system/signals.hpp"
#include "transfer/pipeline.hpp"
#include "util/logger.hpp"
#include "util/worker_group.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace ingest {

BatchRunner::BatchRunner(const Config& cfg,
                         HttpClientMaker make_http,
                         ObjectStoreMaker make_store,
                         IEventSink* events,
                         int jobs)
    : cfg_(cfg),
      make_http_(std::move(make_http)),
      make_store_(std::move(make_store)),
      events_(events),
      jobs_(std::max(1, jobs)) {}

Result BatchRunner::RunOne(const ManifestEntry& entry) {
    std::unique_ptr<IHttpClient> http;
    std::unique_ptr<IObjectStore> store;
    try {
        http = make_http_();
        store = make_store_();
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Io, EIO, std::string("client setup failed: ") + e.what());
    }
    if (!http || !store) {
        return Result::Fail(ErrorKind::Io, EIO, "client setup failed");
    }

    TransferPipeline pipeline(cfg_, *http, *store, events_);
    ManifestEntry done;
    return pipeline.Run(entry, done);
}

BatchSummary BatchRunner::Run(const std::vector<ManifestEntry>& entries) {
    BatchSummary summary;

    std::vector<const ManifestEntry*> unique;
    std::unordered_set<std::string> seen;
    for (const auto& e : entries) {
        if (!seen.insert(RunKeyFor(e)).second) {
            LogInfo("skipping duplicate run key %s", RunKeyFor(e).c_str());
            ++summary.skipped_duplicates;
            continue;
        }
        unique.push_back(&e);
    }

    std::atomic<std::size_t> next{0};
    std::mutex mu;

    auto worker = [&] {
        while (true) {
            const std::size_t idx = next.fetch_add(1);
            if (idx >= unique.size()) return;
            const ManifestEntry& entry = *unique[idx];

            Result r = CancelRequested()
                           ? Result::Fail(ErrorKind::Cancelled, ECANCELED, "cancelled before start")
                           : RunOne(entry);

            std::lock_guard<std::mutex> lk(mu);
            if (r.is_ok()) {
                ++summary.succeeded;
            } else {
                LogError("%s failed [%s]: %s", entry.file_id.c_str(), ErrorKindName(r.kind), r.msg.c_str());
                ++summary.failed;
                summary.failed_ids.push_back(entry.file_id);
            }
        }
    };

    const int workers = static_cast<int>(std::min<std::size_t>(unique.size(), static_cast<std::size_t>(jobs_)));
    RunWorkers(workers, worker);

    LogInfo("batch finished: %zu succeeded, %zu failed, %zu duplicate(s) skipped",
            summary.succeeded, summary.failed, summary.skipped_duplicates);
    return summary;
}

} // namespace ingest
