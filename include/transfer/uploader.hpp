#pragma once

#include "store/object_store.hpp"
#include "transfer/events.hpp"
#include "util/result.hpp"
#include "util/retry.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ingest {

// Decides whether a failed upload attempt may be repeated as a whole.
using TransientUploadPredicate = std::function<bool(const Result&)>;

// True for backend failures whose code is one of `codes`.
TransientUploadPredicate MakeBackendCodePredicate(std::vector<std::string> codes);

struct UploadOptions {
    std::uint64_t multipart_threshold = 25ULL * 1024 * 1024;
    std::uint64_t part_size = 100ULL * 1024 * 1024;
    int max_concurrency = 10;
    RetryPolicy retry{.max_attempts = 3};
    std::vector<std::string> transient_codes{"InvalidPart"};
    // Overrides transient_codes when set.
    TransientUploadPredicate is_transient;
};

// Uploads one local file, multipart above the threshold. The local file is
// never modified or deleted.
class ResilientUploader {
public:
    ResilientUploader(IObjectStore& store, UploadOptions options, IEventSink* events = nullptr);

    Result Upload(const std::string& local_path,
                  const std::string& bucket,
                  const std::string& key,
                  std::string_view file_id = {});

private:
    Result UploadOnce(const FileReader& file,
                      std::uint64_t size,
                      const std::string& bucket,
                      const std::string& key);
    Result UploadMultipart(const FileReader& file,
                           std::uint64_t size,
                           const std::string& bucket,
                           const std::string& key);

    IObjectStore& store_;
    UploadOptions options_;
    TransientUploadPredicate is_transient_;
    IEventSink* events_ = nullptr;
};

} // namespace ingest
