#pragma once
#include <cstdint>
#include <string_view>

namespace ingest {

enum class Phase {
    Start,
    Downloading,
    Verifying,
    Expanding,
    Uploading,
    Cleanup,
    Done,
    Failed,
};

const char* PhaseName(Phase p);

enum class EventType {
    PhaseChanged,
    Progress,
    Retry,
    UnitUploaded,
    Completed,
    Failed,
};

const char* EventTypeName(EventType t);

// Views are only valid for the duration of Report().
struct TransferEvent {
    EventType type = EventType::PhaseChanged;
    std::string_view file_id;
    Phase phase = Phase::Start;

    int percent = -1; // -1 when the total is unknown
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;

    int attempt = 0;
    int max_attempts = 0;

    std::string_view message;
};

// Implementations must tolerate concurrent Report() calls from pipelines
// running side by side.
class IEventSink {
  public:
    virtual ~IEventSink() = default;
    virtual void Report(const TransferEvent& e) = 0;
};

// Null-safe helper used by the transfer modules.
inline void Emit(IEventSink* sink, const TransferEvent& e) {
    if (sink) sink->Report(e);
}

} // namespace ingest
