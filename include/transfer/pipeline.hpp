#pragma once

#include "net/http_client.hpp"
#include "store/object_store.hpp"
#include "transfer/events.hpp"
#include "transfer/workspace.hpp"
#include "util/config.hpp"
#include "util/manifest.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace ingest {

// Moves one manifest entry from its source URL into the object store:
//
//   START -> DOWNLOADING -> VERIFYING -> EXPANDING -> UPLOADING -> CLEANUP -> DONE
//
// Any phase may fail, which ends in FAILED after CLEANUP. The scratch
// workspace never outlives Run(). Units uploaded before a failure stay
// published.
class TransferPipeline {
  public:
    TransferPipeline(const Config& cfg, IHttpClient& http, IObjectStore& store, IEventSink* events = nullptr);

    // On success `out` is the entry that was processed.
    Result Run(const ManifestEntry& entry, ManifestEntry& out);

    // Keys published by the last Run(), in upload order.
    const std::vector<std::string>& UploadedKeys() const { return uploaded_keys_; }

  private:
    Result RunInWorkspace(const ManifestEntry& entry, const Workspace& ws, Phase& phase);
    void EnterPhase(const ManifestEntry& entry, Phase& phase, Phase next);

    const Config& cfg_;
    IHttpClient& http_;
    IObjectStore& store_;
    IEventSink* events_ = nullptr;
    std::vector<std::string> uploaded_keys_;
};

} // namespace ingest
