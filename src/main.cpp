#define _FILE_OFFSET_BITS 64

#include "net/curl_http_client.hpp"
#include "store/s3_object_store.hpp"
#include "system/signals.hpp"
#include "transfer/batch_runner.hpp"
#include "transfer/event_sinks.hpp"
#include "transfer/options.hpp"
#include "transfer/uploader.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"
#include "util/manifest.hpp"
#include "util/manifest_parser.hpp"
#include "util/path_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] run <manifest.tsv>\n"
        "   %s [options] upload <file> --prefix <path/prefix>\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>     JSON configuration file\n"
        "  -j, --jobs <n>          Manifest entries processed in parallel (default 1)\n"
        "  -p, --prefix <prefix>   Destination prefix for 'upload'\n"
        "  -s, --status-file <f>   Write a JSON status document to <f>\n"
        "  -n, --dry-run           Parse the manifest and print the entries only\n"
        "  -v, --verbose           Debug logging\n"
        "  -h, --help              Show this help\n"
        "\n"
        "Environment (overrides the config file):\n"
        "  SCRATCH_PATH, DEST_BUCKET, AWS_S3_ENDPOINT_URL, AWS_REGION,\n"
        "  AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN\n",
        argv, argv);
}

std::unique_ptr<ingest::IObjectStore> MakeStore(const ingest::Config& cfg) {
    return std::make_unique<ingest::S3ObjectStore>(
        ingest::S3OptionsFrom(cfg),
        [] { return std::make_unique<ingest::CurlHttpClient>(); });
}

int DryRun(const std::vector<ingest::ManifestEntry>& entries) {
    for (const auto& e : entries) {
        std::printf("%s\t%s\t%s\t%lld\t%s\t%s\n",
                    ingest::RunKeyFor(e).c_str(),
                    e.file_id.c_str(),
                    e.expected_checksum.c_str(),
                    static_cast<long long>(e.expected_size),
                    e.sample_id.c_str(),
                    e.destination_prefix.c_str());
    }
    return kExitOk;
}

int RunManifest(const ingest::Config& cfg,
                const std::vector<ingest::ManifestEntry>& entries,
                ingest::IEventSink* events,
                int jobs) {
    ingest::BatchRunner runner(
        cfg,
        [] { return std::make_unique<ingest::CurlHttpClient>(); },
        [&cfg] { return MakeStore(cfg); },
        events,
        jobs);

    const auto summary = runner.Run(entries);
    std::printf("succeeded=%zu failed=%zu skipped_duplicates=%zu\n",
                summary.succeeded, summary.failed, summary.skipped_duplicates);
    for (const auto& id : summary.failed_ids) {
        std::printf("failed: %s\n", id.c_str());
    }
    return summary.AllSucceeded() ? kExitOk : kExitFailure;
}

int UploadSingle(const ingest::Config& cfg,
                 const std::string& path,
                 const std::string& prefix,
                 ingest::IEventSink* events) {
    const std::string key = ingest::DestinationKey(prefix, ingest::BaseName(path));

    std::unique_ptr<ingest::IObjectStore> store;
    try {
        store = MakeStore(cfg);
    } catch (const std::exception& e) {
        LogError("cannot create object store client: %s", e.what());
        return kExitFailure;
    }

    ingest::ResilientUploader uploader(*store, ingest::UploadOptionsFrom(cfg), events);
    LogInfo("uploading %s to %s/%s", path.c_str(), cfg.dest_bucket.c_str(), key.c_str());
    auto r = uploader.Upload(path, cfg.dest_bucket, key, ingest::BaseName(path));
    if (!r.is_ok()) {
        LogError("%s [%s]", r.msg.c_str(), ingest::ErrorKindName(r.kind));
        return kExitFailure;
    }
    std::printf("%s\n", key.c_str());
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    ingest::InstallSignalHandlers();

    std::string config_path;
    std::optional<std::string> prefix;
    std::string status_file;
    int jobs = 1;
    bool dry_run = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"jobs", required_argument, nullptr, 'j'},
        {"prefix", required_argument, nullptr, 'p'},
        {"status-file", required_argument, nullptr, 's'},
        {"dry-run", no_argument, nullptr, 'n'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:j:p:s:nv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'c':
                config_path = optarg;
                break;

            case 'j': {
                char* end = nullptr;
                long v = std::strtol(optarg, &end, 10);
                if (!end || *end != '\0' || v <= 0 || v > 1024) {
                    std::fprintf(stderr, "Invalid --jobs: %s\n", optarg);
                    return kExitUsage;
                }
                jobs = static_cast<int>(v);
                break;
            }

            case 'p':
                prefix = optarg;
                break;

            case 's':
                status_file = optarg;
                break;

            case 'n':
                dry_run = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (argc - optind != 2) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    const std::string command = argv[optind];
    const std::string operand = argv[optind + 1];
    if (command != "run" && command != "upload") {
        std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (command == "upload" && !prefix) {
        std::fprintf(stderr, "upload requires --prefix\n");
        return kExitUsage;
    }

    ingest::Config cfg;
    if (!config_path.empty()) {
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitFailure;
        }
    }
    cfg.ApplyEnvironment(ingest::ProcessEnvironment());
    if (!status_file.empty()) cfg.status_file = status_file;

    if (verbose) {
        ingest::Logger::Instance().SetLevel(ingest::LogLevel::Debug);
    } else if (auto lvl = ingest::ParseLogLevel(cfg.log_level)) {
        ingest::Logger::Instance().SetLevel(*lvl);
    }

    std::vector<ingest::ManifestEntry> entries;
    if (command == "run") {
        ingest::ManifestParser parser;
        auto parsed = parser.ParseTsvFile(operand);
        if (!parsed) {
            std::fprintf(stderr, "ERROR: %s\n", parsed.error().c_str());
            return kExitFailure;
        }
        if (parsed->skipped_rows > 0) {
            LogWarn("%zu manifest row(s) without file_id or urls skipped", parsed->skipped_rows);
        }
        if (parsed->entries.empty()) {
            LogWarn("no valid entries found in %s", operand.c_str());
        }
        entries = std::move(parsed->entries);

        if (dry_run) return DryRun(entries);
    } else if (dry_run) {
        std::printf("%s\n", ingest::DestinationKey(*prefix, ingest::BaseName(operand)).c_str());
        return kExitOk;
    }

    const auto valid = command == "run" ? cfg.Validate() : cfg.ValidateStore();
    if (!valid.ok) {
        std::fprintf(stderr, "ERROR: %s\n", valid.msg.c_str());
        return kExitFailure;
    }

    ingest::LogEventSink log_sink;
    ingest::FanoutEventSink events;
    events.Add(&log_sink);
    std::unique_ptr<ingest::JsonStatusSink> status_sink;
    if (!cfg.status_file.empty()) {
        status_sink = std::make_unique<ingest::JsonStatusSink>(cfg.status_file);
        events.Add(status_sink.get());
    }

    if (command == "upload") {
        return UploadSingle(cfg, operand, *prefix, &events);
    }
    return RunManifest(cfg, entries, &events, jobs);
}
