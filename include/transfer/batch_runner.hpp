#pragma once

#include "net/http_client.hpp"
#include "store/object_store.hpp"
#include "transfer/events.hpp"
#include "util/config.hpp"
#include "util/manifest.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ingest {

using HttpClientMaker = std::function<std::unique_ptr<IHttpClient>()>;
using ObjectStoreMaker = std::function<std::unique_ptr<IObjectStore>()>;

struct BatchSummary {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped_duplicates = 0;
    std::vector<std::string> failed_ids;

    bool AllSucceeded() const { return failed == 0; }
};

// Runs manifest entries through independent pipelines, `jobs` at a time.
// Entries sharing a run key are processed once. A failed entry never stops
// its siblings.
class BatchRunner {
  public:
    BatchRunner(const Config& cfg,
                HttpClientMaker make_http,
                ObjectStoreMaker make_store,
                IEventSink* events = nullptr,
                int jobs = 1);

    BatchSummary Run(const std::vector<ManifestEntry>& entries);

  private:
    Result RunOne(const ManifestEntry& entry);

    const Config& cfg_;
    HttpClientMaker make_http_;
    ObjectStoreMaker make_store_;
    IEventSink* events_ = nullptr;
    int jobs_ = 1;
};

} // namespace ingest
