#include "transfer/event_sinks.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>

namespace ingest {

void LogEventSink::Report(const TransferEvent& e) {
    const int id_len = static_cast<int>(e.file_id.size());
    const char* id = e.file_id.data();
    const int msg_len = static_cast<int>(e.message.size());
    const char* msg = e.message.data();

    switch (e.type) {
        case EventType::PhaseChanged:
            LogInfo("[%.*s] -> %s", id_len, id, PhaseName(e.phase));
            break;
        case EventType::Progress:
            if (e.percent >= 0) {
                LogInfo("[%.*s] %s %d%% (%llu/%llu bytes)",
                        id_len, id, PhaseName(e.phase), e.percent,
                        (unsigned long long)e.bytes_done,
                        (unsigned long long)e.bytes_total);
            } else {
                LogInfo("[%.*s] %s %llu bytes",
                        id_len, id, PhaseName(e.phase),
                        (unsigned long long)e.bytes_done);
            }
            break;
        case EventType::Retry:
            LogWarn("[%.*s] %s attempt %d/%d failed: %.*s",
                    id_len, id, PhaseName(e.phase), e.attempt, e.max_attempts, msg_len, msg);
            break;
        case EventType::UnitUploaded:
            LogInfo("[%.*s] uploaded %.*s", id_len, id, msg_len, msg);
            break;
        case EventType::Completed:
            LogInfo("[%.*s] completed", id_len, id);
            break;
        case EventType::Failed:
            LogError("[%.*s] failed in %s: %.*s", id_len, id, PhaseName(e.phase), msg_len, msg);
            break;
    }
}

JsonStatusSink::JsonStatusSink(std::string path) : path_(std::move(path)) {}

void JsonStatusSink::Report(const TransferEvent& e) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = files_.find(e.file_id);
    if (it == files_.end()) {
        it = files_.emplace(std::string(e.file_id), Entry{}).first;
    }
    Entry& s = it->second;

    switch (e.type) {
        case EventType::PhaseChanged:
            s.phase = PhaseName(e.phase);
            s.percent = -1;
            s.state = "running";
            break;
        case EventType::Progress:
            s.percent = e.percent;
            break;
        case EventType::Retry:
            s.attempt = e.attempt;
            s.max_attempts = e.max_attempts;
            s.message = std::string(e.message);
            break;
        case EventType::UnitUploaded:
            ++s.units_uploaded;
            break;
        case EventType::Completed:
            s.phase = PhaseName(Phase::Done);
            s.state = "succeeded";
            s.message.clear();
            break;
        case EventType::Failed:
            s.phase = PhaseName(e.phase);
            s.state = "failed";
            s.message = std::string(e.message);
            break;
    }

    WriteLocked();
}

void JsonStatusSink::WriteLocked() const {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [id, s] : files_) {
        doc[id] = {
            {"phase", s.phase},
            {"state", s.state},
            {"percent", s.percent},
            {"attempt", s.attempt},
            {"max_attempts", s.max_attempts},
            {"units_uploaded", s.units_uploaded},
            {"message", s.message},
        };
    }

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good()) {
        LogWarn("status file not writable: %s", tmp_path.c_str());
        return;
    }
    os << doc.dump(2) << "\n";
    os.close();
    if (!os.good()) {
        LogWarn("status file write failed: %s", tmp_path.c_str());
        return;
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        LogWarn("status file rename failed: %s", path_.c_str());
    }
}

void FanoutEventSink::Add(IEventSink* sink) {
    if (sink) sinks_.push_back(sink);
}

void FanoutEventSink::Report(const TransferEvent& e) {
    for (auto* s : sinks_) s->Report(e);
}

} // namespace ingest
