#include "transfer/pipeline.hpp"

#include "system/signals.hpp"
#include "transfer/archive_expander.hpp"
#include "transfer/downloader.hpp"
#include "transfer/options.hpp"
#include "transfer/uploader.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace ingest {

namespace {

constexpr const char* kUnitsDir = "units";

Result RemoveLocal(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return Result::Fail(errno, "cannot remove " + path + ": " + std::strerror(errno));
    }
    return Result::Ok();
}

bool IsUsableFileId(const std::string& id) {
    return !id.empty() && id != "." && id != ".." && id.find('/') == std::string::npos;
}

} // namespace

TransferPipeline::TransferPipeline(const Config& cfg, IHttpClient& http, IObjectStore& store, IEventSink* events)
    : cfg_(cfg), http_(http), store_(store), events_(events) {}

void TransferPipeline::EnterPhase(const ManifestEntry& entry, Phase& phase, Phase next) {
    phase = next;
    Emit(events_, TransferEvent{.type = EventType::PhaseChanged, .file_id = entry.file_id, .phase = next});
}

Result TransferPipeline::Run(const ManifestEntry& entry, ManifestEntry& out) {
    uploaded_keys_.clear();
    Phase phase = Phase::Start;
    EnterPhase(entry, phase, Phase::Start);

    Result r = Result::Ok();
    if (!IsUsableFileId(entry.file_id)) {
        r = Result::Fail(ErrorKind::Config, EINVAL, "invalid file id: '" + entry.file_id + "'");
    }

    Workspace ws;
    if (r.is_ok()) r = Workspace::Create(cfg_.scratch_root, "ingest-", ws);
    if (r.is_ok()) {
        LogInfo("processing %s for sample %s in %s",
                entry.file_id.c_str(), entry.sample_id.c_str(), ws.Dir().c_str());
        r = RunInWorkspace(entry, ws, phase);
    }

    Phase failed_in = phase;
    EnterPhase(entry, phase, Phase::Cleanup);
    auto cleanup = ws.Remove();
    if (!cleanup.is_ok()) {
        LogWarn("%s", cleanup.msg.c_str());
        if (r.is_ok()) {
            r = cleanup.Wrap("cleanup " + entry.file_id);
            failed_in = Phase::Cleanup;
        }
    }

    if (!r.is_ok()) {
        Emit(events_, TransferEvent{.type = EventType::Failed,
                                    .file_id = entry.file_id,
                                    .phase = failed_in,
                                    .message = r.msg});
        EnterPhase(entry, phase, Phase::Failed);
        return r;
    }

    EnterPhase(entry, phase, Phase::Done);
    Emit(events_, TransferEvent{.type = EventType::Completed, .file_id = entry.file_id, .phase = Phase::Done});
    out = entry;
    return Result::Ok();
}

Result TransferPipeline::RunInWorkspace(const ManifestEntry& entry, const Workspace& ws, Phase& phase) {
    // DOWNLOADING and VERIFYING: the checksum gate runs inside the download.
    EnterPhase(entry, phase, Phase::Downloading);
    if (entry.expected_size > 0) {
        LogInfo("downloading %s (%.2f GB)",
                entry.source_url.c_str(),
                static_cast<double>(entry.expected_size) / (1024.0 * 1024.0 * 1024.0));
    }

    const std::string download_path = ws.PathFor(entry.file_id);
    StreamingDownloader downloader(http_, DownloadOptionsFrom(cfg_), events_);
    DownloadRequest req{.file_id = entry.file_id,
                        .source_url = entry.source_url,
                        .expected_checksum = entry.expected_checksum,
                        .expected_size = entry.expected_size,
                        .destination_path = download_path};
    DownloadResult downloaded;
    auto r = downloader.Download(req, downloaded);
    if (!r.is_ok()) {
        if (r.kind == ErrorKind::Integrity) phase = Phase::Verifying;
        return r;
    }
    phase = Phase::Verifying;

    // EXPANDING
    std::string units_root = ws.Dir();
    std::vector<std::string> units;
    if (IsArchiveName(entry.file_id)) {
        EnterPhase(entry, phase, Phase::Expanding);
        units_root = ws.PathFor(kUnitsDir);
        if (::mkdir(units_root.c_str(), 0755) != 0) {
            return Result::Fail(errno, "mkdir " + units_root + ": " + std::strerror(errno));
        }

        ArchiveExpander expander;
        r = expander.Expand(download_path, units_root, units);
        if (!r.is_ok()) return r.Wrap("expand " + entry.file_id);

        r = RemoveLocal(download_path);
        if (!r.is_ok()) return r;
        if (units.empty()) {
            LogWarn("%s contains no regular files", entry.file_id.c_str());
        }
    } else {
        units.push_back(entry.file_id);
    }

    // UPLOADING
    EnterPhase(entry, phase, Phase::Uploading);
    ResilientUploader uploader(store_, UploadOptionsFrom(cfg_), events_);
    for (const auto& name : units) {
        if (CancelRequested()) {
            return Result::Fail(ErrorKind::Cancelled, ECANCELED, "cancelled before uploading " + name);
        }

        const std::string local = (std::filesystem::path(units_root) / name).string();
        const std::string key = DestinationKey(entry.destination_prefix, name);
        LogInfo("uploading %s to %s/%s", name.c_str(), cfg_.dest_bucket.c_str(), key.c_str());

        r = uploader.Upload(local, cfg_.dest_bucket, key, entry.file_id);
        if (!r.is_ok()) return r;

        uploaded_keys_.push_back(key);
        Emit(events_, TransferEvent{.type = EventType::UnitUploaded,
                                    .file_id = entry.file_id,
                                    .phase = Phase::Uploading,
                                    .message = key});

        r = RemoveLocal(local);
        if (!r.is_ok()) return r;
        LogDebug("deleted local unit %s", local.c_str());
    }

    LogInfo("%s: %zu file(s) published", entry.file_id.c_str(), uploaded_keys_.size());
    return Result::Ok();
}

} // namespace ingest
