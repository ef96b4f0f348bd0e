#pragma once

#include "io/file_reader.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ingest {

struct CompletedPart {
    int part_number = 0;
    std::string etag;
};

// Minimal S3-style object store surface used by the uploader. Failures carry
// the backend's symbolic error code in Result::code when one was reported.
// Implementations must allow concurrent UploadPart calls.
class IObjectStore {
  public:
    virtual ~IObjectStore() = default;

    virtual Result PutObject(const std::string& bucket,
                             const std::string& key,
                             const FileReader& file) = 0;

    virtual Result CreateMultipartUpload(const std::string& bucket,
                                         const std::string& key,
                                         std::string& out_upload_id) = 0;

    virtual Result UploadPart(const std::string& bucket,
                              const std::string& key,
                              const std::string& upload_id,
                              int part_number,
                              const FileReader& file,
                              std::uint64_t offset,
                              std::uint64_t length,
                              std::string& out_etag) = 0;

    virtual Result CompleteMultipartUpload(const std::string& bucket,
                                           const std::string& key,
                                           const std::string& upload_id,
                                           const std::vector<CompletedPart>& parts) = 0;

    virtual Result AbortMultipartUpload(const std::string& bucket,
                                        const std::string& key,
                                        const std::string& upload_id) = 0;
};

} // namespace ingest
