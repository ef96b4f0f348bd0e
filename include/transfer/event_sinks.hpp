#pragma once

#include "transfer/events.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ingest {

// Renders events as log lines.
class LogEventSink final : public IEventSink {
public:
    void Report(const TransferEvent& e) override;
};

// Keeps the latest state per file id and atomically rewrites a JSON status
// document (tmp file + rename) on each event.
class JsonStatusSink final : public IEventSink {
public:
    explicit JsonStatusSink(std::string path);

    void Report(const TransferEvent& e) override;

    const std::string& Path() const { return path_; }

private:
    struct Entry {
        std::string phase;
        int percent = -1;
        int attempt = 0;
        int max_attempts = 0;
        int units_uploaded = 0;
        std::string state;
        std::string message;
    };

    void WriteLocked() const;

    std::string path_;
    std::mutex mu_;
    std::map<std::string, Entry, std::less<>> files_;
};

// Forwards to several sinks in order.
class FanoutEventSink final : public IEventSink {
public:
    void Add(IEventSink* sink);
    void Report(const TransferEvent& e) override;

private:
    std::vector<IEventSink*> sinks_;
};

} // namespace ingest
