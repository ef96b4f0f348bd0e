#pragma once

#include "store/s3_object_store.hpp"
#include "transfer/downloader.hpp"
#include "transfer/uploader.hpp"
#include "util/config.hpp"

namespace ingest {

DownloadOptions DownloadOptionsFrom(const Config& cfg);
UploadOptions UploadOptionsFrom(const Config& cfg);
S3Options S3OptionsFrom(const Config& cfg);

} // namespace ingest
